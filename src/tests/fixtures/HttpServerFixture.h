//
// Runs the http server on its usual port, backed by an in-memory broker
//

#ifndef TRANSIT_RELAY_HTTPSERVERFIXTURE_H
#define TRANSIT_RELAY_HTTPSERVERFIXTURE_H

#include <boost/test/unit_test.hpp>

#include "../../HTTP/HttpServer.h"
#include "RelayFixture.h"

struct HttpServerFixture : public RelayFixture
{
    std::unique_ptr<HttpServer> httpServer;

    HttpServerFixture()
    {
        httpServer = std::make_unique<HttpServer>(broker, settings);

        // Start the http server
        httpServer->start();

        // Wait for the http server
        BOOST_CHECK_EQUAL(acceptingConnections(settings.httpPort), true);
    }

    ~HttpServerFixture()
    {
        // Finished with the server
        httpServer->stop();
    }

    HttpServerFixture(HttpServerFixture const&)                    = delete;
    auto operator=(HttpServerFixture const&) -> HttpServerFixture& = delete;
    HttpServerFixture(HttpServerFixture&&)                         = delete;
    auto operator=(HttpServerFixture&&) -> HttpServerFixture&      = delete;
};

#endif  // TRANSIT_RELAY_HTTPSERVERFIXTURE_H
