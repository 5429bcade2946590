//
// The http surface of the relay: downloads, command line uploads and the health check
//

#ifndef TRANSIT_RELAY_HTTPSERVER_H
#define TRANSIT_RELAY_HTTPSERVER_H

#include "../Broker/Broker.h"
#include "../Lib/GeneralUtils.h"
#include "../Settings.h"
#include <iostream>
#include <server_http.hpp>
#include <thread>

using HttpServerImpl = SimpleWeb::Server<SimpleWeb::HTTP>;

class HttpServer {
public:
    HttpServer(std::shared_ptr<sBroker> broker, const sRelaySettings& settings);

    void start();

    void join();

    void stop();

    auto getServer() -> HttpServerImpl & { return this->server; }

    [[nodiscard]] auto getBroker() const -> const std::shared_ptr<sBroker>& { return broker; }

    [[nodiscard]] auto getSettings() const -> const sRelaySettings& { return settings; }

private:
    HttpServerImpl server;
    std::thread server_thread;
    std::shared_ptr<sBroker> broker;
    const sRelaySettings settings;
};

void HealthApi(const std::string &path, HttpServer *server);
void TransferApi(HttpServer *server);

#endif //TRANSIT_RELAY_HTTPSERVER_H
