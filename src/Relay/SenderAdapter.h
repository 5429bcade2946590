//
// Drives a transfer from the sender's side. The websocket server feeds it frames as they arrive, the http server
// hands it a complete request body.
//

#ifndef TRANSIT_RELAY_SENDERADAPTER_H
#define TRANSIT_RELAY_SENDERADAPTER_H

#include "../Interfaces/ISenderTransport.h"
#include "../Lib/RelayErrors.h"
#include "TransferSession.h"
#include <istream>
#include <memory>
#include <mutex>
#include <thread>

class SenderAdapter {
public:
    SenderAdapter(
            std::shared_ptr<sBroker> broker,
            sRelaySettings settings,
            std::string transferId,
            std::shared_ptr<ISenderTransport> transport
    );
    ~SenderAdapter();

    SenderAdapter(SenderAdapter const&) = delete;
    auto operator=(SenderAdapter const&) -> SenderAdapter& = delete;
    SenderAdapter(SenderAdapter&&) = delete;
    auto operator=(SenderAdapter&&) -> SenderAdapter& = delete;

    // The first text frame, holding the file metadata as json
    void handleHeader(const std::string& header);

    // A binary frame. An empty frame ends the file.
    void handleChunk(const std::vector<uint8_t>& data);

    void handleDisconnect();

    // Runs a whole transfer on the calling thread, reading the file from the stream. Throws eRelayError on failure.
    void transferBlocking(const sFileMetadata& metadata, std::istream& stream);

    [[nodiscard]] auto getSession() const -> std::shared_ptr<TransferSession>;

private:
    void waitForReceiver();
    void reportError(const eRelayError& error);

    std::shared_ptr<sBroker> broker;
    const sRelaySettings settings;
    const std::string transferId;
    std::shared_ptr<ISenderTransport> transport;

    mutable std::mutex sessionMutex;
    std::shared_ptr<TransferSession> session;
    bool closed = false;

    // Waits for the receiver, and then for the end of the transfer, so that the websocket server's threads aren't
    // held up. Declared last so that it is joined before anything it uses is destroyed.
    std::jthread waiterThread;
};

#endif //TRANSIT_RELAY_SENDERADAPTER_H
