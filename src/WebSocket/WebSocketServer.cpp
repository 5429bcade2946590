#include "WebSocketServer.h"
#include "../Lib/RelayErrors.h"
#include "../Relay/ReceiverAdapter.h"
#include "../Relay/SenderAdapter.h"
#include "WebSocketTransports.h"
#include <utility>

WebSocketServer::WebSocketServer(std::shared_ptr<sBroker> broker, const sRelaySettings& settings) :
        broker(std::move(broker)), settings(settings) {
    server.config.port = settings.websocketPort;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = WEBSOCKET_WORKER_POOL_SIZE;
    // A sender legitimately goes quiet while it waits for the receiver
    server.config.timeout_idle = static_cast<long>(
            std::chrono::duration_cast<std::chrono::seconds>(settings.receiverTimeout + settings.idleTimeout).count()
    );

    setupSendEndpoint();
    setupReceiveEndpoint();
}

// Text and binary frames are told apart by the opcode, see RFC 6455 5.2
static auto isTextFrame(const std::shared_ptr<WsServer::InMessage>& message) -> bool {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    return (message->fin_rsv_opcode & 0x0f) == 1;
}

static void rejectConnection(const std::shared_ptr<WsServer::Connection>& connection, const eRelayError& error) {
    sendWebsocketFrame(connection, error.clientMessage(), WS_TEXT_FRAME);
    connection->send_close(CLOSE_STATUS_ERROR, error.what());
}

auto WebSocketServer::getSender(const std::shared_ptr<WsServer::Connection>& connection) -> std::shared_ptr<SenderAdapter> {
    auto iter = senders.find(connection);
    return iter == senders.end() ? nullptr : iter->second;
}

auto WebSocketServer::getReceiver(const std::shared_ptr<WsServer::Connection>& connection) -> std::shared_ptr<sReceiverConnection> {
    auto iter = receivers.find(connection);
    return iter == receivers.end() ? nullptr : iter->second;
}

void WebSocketServer::setupSendEndpoint() {
    auto &wsEp = server.endpoint["^/send/([^/]+)/?$"];

    wsEp.on_open = [this](const std::shared_ptr<WsServer::Connection>& connection) {
        auto transferId = connection->path_match[1].str();

        if (!isValidTransferId(transferId)) {
            std::cout << "WS: Rejected sender with invalid transfer id " << transferId << std::endl;
            rejectConnection(connection, eValidationError("Invalid transfer ID."));
            return;
        }

        std::cout << "WS: Opened sender connection for " << transferId << std::endl;

        senders.insert_or_assign(
                connection,
                std::make_shared<SenderAdapter>(
                        broker, settings, transferId, std::make_shared<WsSenderTransport>(connection)
                )
        );
    };

    wsEp.on_message = [this](const std::shared_ptr<WsServer::Connection>& connection, const std::shared_ptr<WsServer::InMessage>& in_message) {
        auto sender = getSender(connection);
        if (!sender) {
            return;
        }

        if (isTextFrame(in_message)) {
            sender->handleHeader(in_message->string());
            return;
        }

        // Blocks while the receiver catches up, which stops this connection from being read any further
        auto data = in_message->string();
        sender->handleChunk(std::vector<uint8_t>(data.begin(), data.end()));
    };

    // See RFC 6455 7.4.1. for status codes
    wsEp.on_close = [this](const std::shared_ptr<WsServer::Connection>& connection, int status, const std::string & /*reason*/) {
        auto sender = getSender(connection);
        if (sender) {
            senders.erase(connection);
            sender->handleDisconnect();
        }

        std::cout << "WS: Closed sender connection with status code " << status << std::endl;
    };

    // See http://www.boost.org/doc/libs/1_55_0/doc/html/boost_asio/reference.html, Error Codes for error code meanings
    wsEp.on_error = [this](const std::shared_ptr<WsServer::Connection>& connection, const SimpleWeb::error_code &errorCode) {
        auto sender = getSender(connection);
        if (sender) {
            senders.erase(connection);
            sender->handleDisconnect();
        }

        std::cout << "WS: Error in sender connection. "
                  << "Error: " << errorCode << ", error message: " << errorCode.message() << std::endl;
    };
}

void WebSocketServer::setupReceiveEndpoint() {
    auto &wsEp = server.endpoint["^/receive/([^/]+)/?$"];

    wsEp.on_open = [this](const std::shared_ptr<WsServer::Connection>& connection) {
        auto transferId = connection->path_match[1].str();

        auto receiver = std::make_shared<sReceiverConnection>();
        receiver->adapter = std::make_shared<ReceiverAdapter>(
                broker, settings, transferId, std::make_shared<WsReceiverTransport>(connection)
        );

        // Registered before the metadata goes out, the client may answer straight away
        receivers.insert_or_assign(connection, receiver);

        try {
            // Sends the metadata frame. The sender is released once the client answers with the go message.
            receiver->adapter->open(false);
        } catch (eRelayError& error) {
            receivers.erase(connection);

            std::cout << "WS: Rejected receiver for " << transferId << ": " << error.what() << std::endl;
            rejectConnection(connection, error);
            return;
        }

        std::cout << "WS: Opened receiver connection for " << transferId << std::endl;
    };

    wsEp.on_message = [this](const std::shared_ptr<WsServer::Connection>& connection, const std::shared_ptr<WsServer::InMessage>& in_message) {
        auto receiver = getReceiver(connection);
        if (!receiver) {
            return;
        }

        if (!isTextFrame(in_message) || in_message->string() != GO_FOR_FILE_CHUNKS) {
            std::cout << "WS: Ignoring unexpected frame from receiver" << std::endl;
            return;
        }

        if (receiver->started.exchange(true)) {
            return;
        }

        // Stream on a thread of its own, the connection still has to be able to report a close
        std::thread([adapter = receiver->adapter]() {
            try {
                adapter->run();
            } catch (std::exception& e) {
                dumpExceptions(e);
                adapter->handleDisconnect();
            }
        }).detach();
    };

    // See RFC 6455 7.4.1. for status codes
    wsEp.on_close = [this](const std::shared_ptr<WsServer::Connection>& connection, int status, const std::string & /*reason*/) {
        auto receiver = getReceiver(connection);
        if (receiver) {
            receivers.erase(connection);
            receiver->adapter->handleDisconnect();
        }

        std::cout << "WS: Closed receiver connection with status code " << status << std::endl;
    };

    // See http://www.boost.org/doc/libs/1_55_0/doc/html/boost_asio/reference.html, Error Codes for error code meanings
    wsEp.on_error = [this](const std::shared_ptr<WsServer::Connection>& connection, const SimpleWeb::error_code &errorCode) {
        auto receiver = getReceiver(connection);
        if (receiver) {
            receivers.erase(connection);
            receiver->adapter->handleDisconnect();
        }

        std::cout << "WS: Error in receiver connection. "
                  << "Error: " << errorCode << ", error message: " << errorCode.message() << std::endl;
    };
}

void WebSocketServer::start() {
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    // Wait a for the server to initialise
    while (!acceptingConnections(server.config.port)){ }

    std::cout << "WS: Server listening on port " << server.config.port << std::endl;
}

void WebSocketServer::join() {
    server_thread.join();
}

void WebSocketServer::stop() {
    server.stop();
    join();
}
