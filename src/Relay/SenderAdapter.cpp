#include "SenderAdapter.h"
#include "../Lib/GeneralUtils.h"
#include <iostream>

SenderAdapter::SenderAdapter(
        std::shared_ptr<sBroker> broker,
        sRelaySettings settings,
        std::string transferId,
        std::shared_ptr<ISenderTransport> transport
) : broker(std::move(broker)),
    settings(std::move(settings)),
    transferId(std::move(transferId)),
    transport(std::move(transport)) {}

SenderAdapter::~SenderAdapter() {
    try {
        handleDisconnect();
    } catch (std::exception& exception) {
        dumpExceptions(exception);
    }
}

auto SenderAdapter::getSession() const -> std::shared_ptr<TransferSession> {
    std::unique_lock<std::mutex> lock(sessionMutex);
    return session;
}

void SenderAdapter::handleHeader(const std::string& header) {
    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        if (session || closed) {
            std::cout << "WS: Ignoring unexpected text frame for transfer " << transferId << std::endl;
            return;
        }
    }

    try {
        auto metadata = sFileMetadata::fromJsonString(header);
        auto newSession = TransferSession::create(broker, settings, transferId, metadata);

        std::unique_lock<std::mutex> lock(sessionMutex);
        session = newSession;
    } catch (eRelayError& error) {
        std::cout << "WS: Rejected sender for transfer " << transferId << ": " << error.what() << std::endl;
        reportError(error);
        return;
    }

    waiterThread = std::jthread([this]() { waitForReceiver(); });
}

void SenderAdapter::waitForReceiver() {
    auto current = getSession();

    try {
        current->awaitReceiver();
        transport->sendText(GO_FOR_FILE_CHUNKS);

        // The sender may go quiet, so the end of the transfer is watched here rather than in handleChunk
        current->awaitCompletion();
    } catch (eRelayError& error) {
        reportError(error);
    } catch (std::exception& exception) {
        dumpExceptions(exception);
        current->fail("Sender disconnected.");
        reportError(eTransportError(exception.what()));
    }
}

void SenderAdapter::handleChunk(const std::vector<uint8_t>& data) {
    auto current = getSession();
    if (!current) {
        reportError(eValidationError("Invalid file metadata: the metadata must be sent before any data."));
        return;
    }

    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        if (closed) {
            return;
        }
    }

    try {
        if (data.empty()) {
            current->finish();

            {
                std::unique_lock<std::mutex> lock(sessionMutex);
                closed = true;
            }
            transport->close(CLOSE_STATUS_NORMAL, "Transfer complete.");
            return;
        }

        current->pushChunk(data);
    } catch (eRelayError& error) {
        reportError(error);
    }
}

void SenderAdapter::handleDisconnect() {
    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        closed = true;
    }

    auto current = getSession();
    if (current && !current->isTerminal()) {
        current->fail("Sender disconnected.");
    }
}

void SenderAdapter::transferBlocking(const sFileMetadata& metadata, std::istream& stream) {
    auto current = TransferSession::create(broker, settings, transferId, metadata);
    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        session = current;
    }

    current->awaitReceiver();

    std::vector<char> buffer(settings.chunkSize);
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto count = stream.gcount();
        if (count <= 0) {
            break;
        }

        current->pushChunk(std::vector<uint8_t>(buffer.begin(), buffer.begin() + count));
    }

    // Throws if the body was shorter than the declared size
    current->finish();
}

void SenderAdapter::reportError(const eRelayError& error) {
    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        if (closed) {
            return;
        }
        closed = true;
    }

    transport->sendText(error.clientMessage());
    transport->close(CLOSE_STATUS_ERROR, error.what());
}
