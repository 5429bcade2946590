#include "WebSocketTransports.h"
#include "../Lib/RelayErrors.h"
#include "../Relay/FileMetadata.h"
#include <future>
#include <iterator>

void sendWebsocketFrame(
        const std::shared_ptr<WsServer::Connection>& connection,
        const std::string& data,
        unsigned char opcode,
        const std::function<void(const SimpleWeb::error_code&)>& callback
) {
    auto outMessage = std::make_shared<WsServer::OutMessage>(data.size());
    *outMessage << data;

    connection->send(outMessage, callback, opcode);
}

void WsSenderTransport::sendText(const std::string& message) {
    sendWebsocketFrame(connection, message, WS_TEXT_FRAME);
}

void WsSenderTransport::close(int status, const std::string& reason) {
    connection->send_close(status, reason);
}

void WsReceiverTransport::sendMetadata(const sFileMetadata& metadata) {
    sendWebsocketFrame(connection, metadata.toJson().dump(), WS_TEXT_FRAME);
}

void WsReceiverTransport::writeChunk(const std::vector<uint8_t>& data) {
    // Convert the chunk
    auto outMessage = std::make_shared<WsServer::OutMessage>(data.size());
    std::copy(data.begin(), data.end(), std::ostream_iterator<uint8_t>(*outMessage));

    // Wait for the chunk to be sent before the next one is taken off the channel
    std::promise<SimpleWeb::error_code> sendPromise;
    connection->send(
            outMessage,
            [&sendPromise](const SimpleWeb::error_code &errorCode) {
                sendPromise.set_value(errorCode);
            },
            WS_BINARY_FRAME
    );

    if (auto errorCode = sendPromise.get_future().get()) {
        throw eTransportError(
                "Error transmitting file content to client. Perhaps client has disconnected? "
                + std::to_string(errorCode.value()) + " " + errorCode.message()
        );
    }
}

void WsReceiverTransport::finish() {
    // An empty binary frame marks the end of the file
    sendWebsocketFrame(connection, "", WS_BINARY_FRAME);
    connection->send_close(CLOSE_STATUS_NORMAL, "Transfer complete.");
}

void WsReceiverTransport::abort(const std::string& reason) {
    sendWebsocketFrame(connection, reason, WS_TEXT_FRAME);
    connection->send_close(CLOSE_STATUS_ERROR, reason);
}
