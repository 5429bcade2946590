#include "TransferSession.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/RelayErrors.h"
#include <algorithm>
#include <iostream>

auto sessionStateName(eSessionState state) -> std::string {
    switch (state) {
        case eSessionState::created:
            return "created";
        case eSessionState::awaitingReceiver:
            return "awaiting receiver";
        case eSessionState::streaming:
            return "streaming";
        case eSessionState::completed:
            return "completed";
        case eSessionState::failed:
            return "failed";
        case eSessionState::expired:
            return "expired";
    }
    return "unknown";
}

auto TransferSession::create(
        std::shared_ptr<sBroker> broker,
        const sRelaySettings& settings,
        const std::string& transferId,
        const sFileMetadata& metadata
) -> std::shared_ptr<TransferSession> {
    if (!isValidTransferId(transferId)) {
        throw eValidationError("Invalid transfer ID.");
    }

    auto record = sTransferRecord{
            .transferId = transferId,
            .generation = generateUUID(),
            .metadata = metadata,
            .createdAt = std::chrono::system_clock::now(),
            .ttl = settings.recordTtl
    };

    // Opening the readiness signal is the claim on the transfer id. The lifetime only matters if this process dies
    // without cleaning up, after which another sender may take the id over.
    if (!broker->readinessChannel->open(transferId, record.generation, settings.receiverTimeout + settings.recordTtl)) {
        throw eConflictError();
    }

    // A stale readiness signal may have been taken over from a transfer that is still streaming
    if (broker->metadataStore->exists(transferId)) {
        broker->readinessChannel->close(transferId, record.generation);
        throw eConflictError();
    }

    broker->chunkChannel->open(record.channelKey());

    // The metadata is published last, so a receiver that can read it always finds the readiness signal open
    if (!broker->metadataStore->put(record)) {
        broker->chunkChannel->remove(record.channelKey());
        broker->readinessChannel->close(transferId, record.generation);
        throw eConflictError();
    }

    auto session = std::make_shared<TransferSession>(std::move(broker), settings, record, eSessionRole::sender);
    session->log("Created for " + metadata.toString());
    return session;
}

auto TransferSession::attach(
        std::shared_ptr<sBroker> broker,
        const sRelaySettings& settings,
        const std::string& transferId
) -> std::shared_ptr<TransferSession> {
    if (!isValidTransferId(transferId)) {
        throw eValidationError("Invalid transfer ID.");
    }

    // Throws eNotFoundError
    auto record = broker->metadataStore->get(transferId);

    if (!broker->metadataStore->claimReceiver(transferId, record.generation)) {
        throw eConflictError();
    }

    // The record read back carries the generation, so this session can never touch a later transfer on the same id
    auto session = std::make_shared<TransferSession>(std::move(broker), settings, record, eSessionRole::receiver);
    session->log("Receiver attached");
    return session;
}

TransferSession::TransferSession(
        std::shared_ptr<sBroker> broker,
        sRelaySettings settings,
        sTransferRecord record,
        eSessionRole role
) : broker(std::move(broker)),
    settings(std::move(settings)),
    transferId(record.transferId),
    generation(record.generation),
    channelKey(record.channelKey()),
    metadata(std::move(record.metadata)),
    role(role) {}

TransferSession::~TransferSession() {
    // A session that is dropped half way must not leave the other side waiting
    try {
        if (!isTerminal()) {
            fail(role == eSessionRole::sender ? "Sender disconnected." : "Transfer was interrupted by the receiver.");
        }

        if (role == eSessionRole::sender) {
            cleanup();
        }
    } catch (std::exception& exception) {
        dumpExceptions(exception);
    }
}

void TransferSession::awaitReceiver() {
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (state != eSessionState::created) {
            lock.unlock();
            throwFailure();
        }

        state = eSessionState::awaitingReceiver;
    }
    stateCV.notify_all();

    log("Waiting for a receiver");

    auto ready = broker->readinessChannel->awaitReady(transferId, generation, settings.receiverTimeout);

    if (ready) {
        {
            std::unique_lock<std::mutex> lock(stateMutex);
            if (state == eSessionState::awaitingReceiver) {
                state = eSessionState::streaming;
            }
        }
        stateCV.notify_all();

        if (getState() != eSessionState::streaming) {
            throwFailure();
        }

        log("Receiver is ready, streaming " + metadata.toString());
        return;
    }

    // The wait also ends early if the session failed in the meantime, in which case the reason is already set
    if (terminate(eSessionState::expired, "Receiver did not connect in time.", true)) {
        log("Receiver did not connect in time");
        cleanup();
    }

    throwFailure();
}

auto TransferSession::awaitStreaming() -> bool {
    std::unique_lock<std::mutex> lock(stateMutex);
    stateCV.wait(lock, [this] {
        return state != eSessionState::created && state != eSessionState::awaitingReceiver;
    });

    return state == eSessionState::streaming;
}

void TransferSession::pushChunk(const std::vector<uint8_t>& data) {
    if (!awaitStreaming()) {
        throwFailure();
    }

    if (bytesTransferred + data.size() > metadata.size) {
        fail("Received more data than expected.");
        throwFailure();
    }

    for (size_t offset = 0; offset < data.size(); offset += settings.chunkSize) {
        auto end = std::min(data.size(), offset + settings.chunkSize);
        auto chunk = std::make_shared<std::vector<uint8_t>>(
                data.begin() + static_cast<std::ptrdiff_t>(offset),
                data.begin() + static_cast<std::ptrdiff_t>(end)
        );

        switch (broker->chunkChannel->push(channelKey, sChunk{chunk}, settings.idleTimeout)) {
            case ePushResult::ok:
                bytesTransferred += chunk->size();
                break;
            case ePushResult::interrupted:
                // A no-op if this side failed first, in which case that reason is reported
                fail("Transfer was interrupted by the receiver.");
                throwFailure();
            case ePushResult::timedOut:
                failWith("Timeout during upload.", true);
                throwFailure();
            case ePushResult::closed:
                fail("Received more data than expected.");
                throwFailure();
        }
    }
}

void TransferSession::finish() {
    if (!awaitStreaming()) {
        throwFailure();
    }

    if (bytesTransferred < metadata.size) {
        fail("Received less data than expected.");
        throwFailure();
    }

    auto result = broker->chunkChannel->push(channelKey, sDone{}, settings.idleTimeout);
    if (result == ePushResult::interrupted) {
        fail("Transfer was interrupted by the receiver.");
        throwFailure();
    }

    // Keep waiting for as long as the receiver is still making progress through the buffered data
    auto lastBuffered = broker->chunkChannel->bufferedBytes(channelKey);
    while (true) {
        auto drained = broker->chunkChannel->awaitDrained(channelKey, settings.idleTimeout);

        if (drained == eDrainResult::drained) {
            break;
        }

        if (drained == eDrainResult::interrupted) {
            fail("Transfer was interrupted by the receiver.");
            throwFailure();
        }

        auto buffered = broker->chunkChannel->bufferedBytes(channelKey);
        if (buffered >= lastBuffered) {
            failWith("Timeout during upload.", true);
            throwFailure();
        }
        lastBuffered = buffered;
    }

    if (terminate(eSessionState::completed, "")) {
        log("Transfer complete, " + formatSize(bytesTransferred) + " sent");
    }

    cleanup();
}

void TransferSession::awaitCompletion() {
    if (!awaitStreaming()) {
        throwFailure();
    }

    while (!isTerminal()) {
        auto result = broker->chunkChannel->awaitDrained(channelKey, settings.idleTimeout);

        if (result == eDrainResult::drained) {
            // finish() completes the session
            return;
        }

        if (result == eDrainResult::interrupted) {
            fail("Transfer was interrupted by the receiver.");
        }
    }

    if (getState() != eSessionState::completed) {
        throwFailure();
    }
}

void TransferSession::signalReady() {
    if (!broker->readinessChannel->signalReady(transferId, generation)) {
        // The sender gave up before the receiver was ready
        terminate(eSessionState::failed, "File not found.");
        throw eNotFoundError();
    }

    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (state == eSessionState::created) {
            state = eSessionState::streaming;
        }
    }
    stateCV.notify_all();

    log("Receiver is ready");
}

void TransferSession::checkSenderPresent() {
    // The sender removes the record first when it cleans up
    bool present = false;
    try {
        present = broker->metadataStore->get(transferId).generation == generation;
    } catch (eNotFoundError&) {
        present = false;
    }

    if (present) {
        return;
    }

    terminate(eSessionState::failed, "File not found.");
    throw eNotFoundError();
}

auto TransferSession::nextChunk() -> std::shared_ptr<std::vector<uint8_t>> {
    switch (getState()) {
        case eSessionState::completed:
            return nullptr;
        case eSessionState::failed:
        case eSessionState::expired:
            throwFailure();
        default:
            break;
    }

    auto item = broker->chunkChannel->pop(channelKey, settings.idleTimeout);

    if (!item) {
        failWith("Timeout during download.", true);
        throwFailure();
    }

    if (std::holds_alternative<sInterrupt>(*item)) {
        // The sender side owns the cleanup, so only the state changes here
        if (terminate(eSessionState::failed, "Sender disconnected.")) {
            log("Interrupted by the sender");
        }
        throwFailure();
    }

    if (std::holds_alternative<sDone>(*item)) {
        if (bytesTransferred < metadata.size) {
            fail("Received less data than expected.");
            throwFailure();
        }

        if (terminate(eSessionState::completed, "")) {
            log("Transfer complete, " + formatSize(bytesTransferred) + " received");
        }
        return nullptr;
    }

    auto data = std::get<sChunk>(*item).data;
    bytesTransferred += data->size();

    if (bytesTransferred > metadata.size) {
        fail("Received more data than expected.");
        throwFailure();
    }

    return data;
}

void TransferSession::fail(const std::string& reason) {
    failWith(reason, false);
}

void TransferSession::failWith(const std::string& reason, bool timedOut) {
    if (!terminate(eSessionState::failed, reason, timedOut)) {
        return;
    }

    log("Failed: " + reason);

    if (cleanedUp) {
        return;
    }

    broker->chunkChannel->interrupt(channelKey);

    if (role == eSessionRole::sender) {
        cleanup();
    } else {
        // A sender still waiting for this receiver is released, and then finds the stream interrupted
        broker->readinessChannel->signalReady(transferId, generation);
    }
}

void TransferSession::cleanup() {
    if (cleanedUp.exchange(true)) {
        return;
    }

    // The readiness signal goes last, the transfer id can't be claimed again until everything else is gone
    broker->metadataStore->remove(transferId, generation);
    broker->chunkChannel->remove(channelKey);
    broker->readinessChannel->close(transferId, generation);

    log("Cleaned up (" + sessionStateName(getState()) + ")");
}

auto TransferSession::getState() const -> eSessionState {
    std::unique_lock<std::mutex> lock(stateMutex);
    return state;
}

auto TransferSession::isTerminal() const -> bool {
    auto current = getState();
    return current == eSessionState::completed
        || current == eSessionState::failed
        || current == eSessionState::expired;
}

auto TransferSession::getFailureReason() const -> std::string {
    std::unique_lock<std::mutex> lock(stateMutex);
    return failureReason;
}

auto TransferSession::terminate(eSessionState terminalState, const std::string& reason, bool timedOut) -> bool {
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (state == eSessionState::completed || state == eSessionState::failed || state == eSessionState::expired) {
            return false;
        }

        state = terminalState;
        failureReason = reason;
        failureWasTimeout = timedOut;
    }

    stateCV.notify_all();
    return true;
}

void TransferSession::throwFailure() const {
    std::unique_lock<std::mutex> lock(stateMutex);

    if (failureWasTimeout) {
        throw eTimeoutError(failureReason);
    }

    if (state == eSessionState::completed) {
        throw std::logic_error("Transfer " + transferId + " has already completed");
    }

    throw eTransportError(failureReason.empty() ? "Transfer is no longer active." : failureReason);
}

void TransferSession::log(const std::string& message) const {
    std::cout << "Transfer " << transferId << ": " << message << std::endl;
}
