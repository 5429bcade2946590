//
// The websocket surface of the relay: browser senders on /send/{id}, browser receivers on /receive/{id}
//

#ifndef TRANSIT_RELAY_WEBSOCKETSERVER_H
#define TRANSIT_RELAY_WEBSOCKETSERVER_H

// Hack to prevent DEPRECATED from being undefined in server_ws.hpp
#ifndef DEPRECATED
#define DEPRECATED
#endif
#include <server_ws.hpp>

#include "../Broker/Broker.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <atomic>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <thread>

using WsServer = SimpleWeb::SocketServer<SimpleWeb::WS>;

class SenderAdapter;
class ReceiverAdapter;

class WebSocketServer {
public:
    WebSocketServer(std::shared_ptr<sBroker> broker, const sRelaySettings& settings);

    void start();
    void join();
    void stop();

private:
    struct sReceiverConnection {
        std::shared_ptr<ReceiverAdapter> adapter;
        std::atomic<bool> started = false;
    };

    void setupSendEndpoint();
    void setupReceiveEndpoint();

    auto getSender(const std::shared_ptr<WsServer::Connection>& connection) -> std::shared_ptr<SenderAdapter>;
    auto getReceiver(const std::shared_ptr<WsServer::Connection>& connection) -> std::shared_ptr<sReceiverConnection>;

    WsServer server;
    std::thread server_thread;

    std::shared_ptr<sBroker> broker;
    const sRelaySettings settings;

    folly::ConcurrentHashMap<std::shared_ptr<WsServer::Connection>, std::shared_ptr<SenderAdapter>> senders;
    folly::ConcurrentHashMap<std::shared_ptr<WsServer::Connection>, std::shared_ptr<sReceiverConnection>> receivers;

// Testing
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(senders);
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(receivers);
};

#endif //TRANSIT_RELAY_WEBSOCKETSERVER_H
