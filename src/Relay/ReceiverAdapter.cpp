#include "ReceiverAdapter.h"
#include "../Lib/RelayErrors.h"
#include <iostream>

ReceiverAdapter::ReceiverAdapter(
        std::shared_ptr<sBroker> broker,
        sRelaySettings settings,
        std::string transferId,
        std::shared_ptr<IReceiverTransport> transport
) : broker(std::move(broker)),
    settings(std::move(settings)),
    transferId(std::move(transferId)),
    transport(std::move(transport)) {}

auto ReceiverAdapter::getSession() const -> std::shared_ptr<TransferSession> {
    std::unique_lock<std::mutex> lock(sessionMutex);
    return session;
}

auto ReceiverAdapter::open(bool readyNow) -> sFileMetadata {
    auto current = TransferSession::attach(broker, settings, transferId);
    {
        std::unique_lock<std::mutex> lock(sessionMutex);
        session = current;
    }

    // A sender that went away in the meantime must be reported as not found, which is no longer possible once the
    // metadata was written
    if (readyNow) {
        current->signalReady();
    } else {
        current->checkSenderPresent();
    }

    try {
        transport->sendMetadata(current->getMetadata());
    } catch (eTransportError&) {
        current->fail("Transfer was interrupted by the receiver.");
        throw;
    }

    return current->getMetadata();
}

auto ReceiverAdapter::run() -> bool {
    auto current = getSession();
    if (!current) {
        throw std::logic_error("Receiver for transfer " + transferId + " was run before it was opened");
    }

    try {
        if (current->getState() == eSessionState::created) {
            current->signalReady();
        }

        while (auto data = current->nextChunk()) {
            try {
                transport->writeChunk(*data);
            } catch (eTransportError&) {
                current->fail("Transfer was interrupted by the receiver.");
                throw;
            }
        }

        transport->finish();
        return true;
    } catch (eRelayError& error) {
        std::cout << "Transfer " << transferId << ": Receiver stopped: " << error.what() << std::endl;
        transport->abort(error.clientMessage());
        return false;
    }
}

void ReceiverAdapter::handleDisconnect() {
    auto current = getSession();
    if (current && !current->isTerminal()) {
        current->fail("Transfer was interrupted by the receiver.");
    }
}
