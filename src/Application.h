//
// Wires the settings, the broker, both servers and the expiry sweeper together
//

#ifndef TRANSIT_RELAY_APPLICATION_H
#define TRANSIT_RELAY_APPLICATION_H

#include "Broker/Broker.h"
#include "HTTP/HttpServer.h"
#include "Lib/GeneralUtils.h"
#include "Settings.h"
#include "WebSocket/WebSocketServer.h"
#include <memory>
#include <thread>

class Application {
public:
    explicit Application(const sRelaySettings& settings);

    // Starts both servers and the sweeper, returns once they are listening
    void start();

    // Blocks until the http server stops
    void join();

    void stop();

    [[nodiscard]] auto getBroker() const -> const std::shared_ptr<sBroker>& { return broker; }

    [[nodiscard]] auto getSettings() const -> const sRelaySettings& { return settings; }

private:
    // Removes the state of transfers that were never picked up by a receiver
    void pruneExpiredTransfers();
    void runPruneLoop();

    const sRelaySettings settings;
    std::shared_ptr<sBroker> broker;

    std::unique_ptr<HttpServer> httpServer;
    std::unique_ptr<WebSocketServer> websocketServer;

    InterruptableTimer interruptablePruneTimer;
    std::jthread pruneThread;

// Testing
    EXPOSE_FUNCTION_FOR_TESTING(pruneExpiredTransfers);
};

#endif //TRANSIT_RELAY_APPLICATION_H
