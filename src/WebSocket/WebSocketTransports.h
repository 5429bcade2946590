//
// The websocket bindings of the sender and receiver adapters
//

#ifndef TRANSIT_RELAY_WEBSOCKETTRANSPORTS_H
#define TRANSIT_RELAY_WEBSOCKETTRANSPORTS_H

#include "../Interfaces/IReceiverTransport.h"
#include "../Interfaces/ISenderTransport.h"
#include "WebSocketServer.h"
#include <memory>

// Frame opcodes, see RFC 6455 5.2
const unsigned char WS_TEXT_FRAME = 129;
const unsigned char WS_BINARY_FRAME = 130;

void sendWebsocketFrame(
        const std::shared_ptr<WsServer::Connection>& connection,
        const std::string& data,
        unsigned char opcode,
        const std::function<void(const SimpleWeb::error_code&)>& callback = nullptr
);

class WsSenderTransport : public ISenderTransport {
public:
    explicit WsSenderTransport(std::shared_ptr<WsServer::Connection> connection) : connection(std::move(connection)) {}

    void sendText(const std::string& message) override;
    void close(int status, const std::string& reason) override;

private:
    std::shared_ptr<WsServer::Connection> connection;
};

class WsReceiverTransport : public IReceiverTransport {
public:
    explicit WsReceiverTransport(std::shared_ptr<WsServer::Connection> connection) : connection(std::move(connection)) {}

    void sendMetadata(const sFileMetadata& metadata) override;
    void writeChunk(const std::vector<uint8_t>& data) override;
    void finish() override;
    void abort(const std::string& reason) override;

private:
    std::shared_ptr<WsServer::Connection> connection;
};

#endif //TRANSIT_RELAY_WEBSOCKETTRANSPORTS_H
