//
// Drives a transfer from the receiver's side, writing the file out through a websocket or an http response
//

#ifndef TRANSIT_RELAY_RECEIVERADAPTER_H
#define TRANSIT_RELAY_RECEIVERADAPTER_H

#include "../Interfaces/IReceiverTransport.h"
#include "TransferSession.h"
#include <memory>
#include <mutex>

class ReceiverAdapter {
public:
    ReceiverAdapter(
            std::shared_ptr<sBroker> broker,
            sRelaySettings settings,
            std::string transferId,
            std::shared_ptr<IReceiverTransport> transport
    );

    // Binds this receiver to the transfer and announces the file. With readyNow the sender is released before
    // anything is written, otherwise that happens in run(). Throws eValidationError, eNotFoundError or
    // eConflictError, in which case nothing was written to the transport.
    auto open(bool readyNow) -> sFileMetadata;

    // Streams the file to the transport. Returns false if the transfer failed, after the transport was aborted.
    auto run() -> bool;

    void handleDisconnect();

    [[nodiscard]] auto getSession() const -> std::shared_ptr<TransferSession>;

private:
    std::shared_ptr<sBroker> broker;
    const sRelaySettings settings;
    const std::string transferId;
    std::shared_ptr<IReceiverTransport> transport;

    mutable std::mutex sessionMutex;
    std::shared_ptr<TransferSession> session;
};

#endif //TRANSIT_RELAY_RECEIVERADAPTER_H
