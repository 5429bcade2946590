#include "HttpServer.h"
#include "HttpUtils.h"

HttpServer::HttpServer(std::shared_ptr<sBroker> broker, const sRelaySettings& settings) :
        broker(std::move(broker)), settings(settings) {
    server.config.port = settings.httpPort;
    server.config.address = "0.0.0.0";
    server.config.thread_pool_size = HTTP_WORKER_POOL_SIZE;
    server.config.timeout_content = static_cast<long>(
            std::chrono::duration_cast<std::chrono::seconds>(settings.receiverTimeout + settings.idleTimeout).count()
    );

    // The whole body of a request is read before its handler runs. A Content-Length over this limit is answered
    // with 413 by the server itself, without reading the body.
    server.config.max_request_streambuf_size = settings.httpUploadMaxSize + HTTP_MAX_HEADER_SIZE;

    // Add the various API's
    HealthApi("/health", this);
    TransferApi(this);

    // Anything else isn't a transfer
    for (const auto *method : {"GET", "PUT", "POST", "DELETE", "HEAD"}) {
        server.default_resource[method] = [](
                const std::shared_ptr<HttpServerImpl::Response> &response,
                const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
            response->write(SimpleWeb::StatusCode::client_error_not_found, "Error: Not found.");
        };
    }
}

void HttpServer::start() {
    server_thread = std::thread([this]() {
        // Start server
        this->server.start();
    });

    std::cout << "API: Server listening on port " << server.config.port << std::endl << std::endl;
}

void HttpServer::join() {
    server_thread.join();
}

void HttpServer::stop() {
    server.stop();
    join();
}

void HealthApi(const std::string &path, HttpServer *server) {
    server->getServer().resource["^" + path + "/?$"]["GET"] = [](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &/*request*/) {
        nlohmann::json result;
        result["status"] = "ok";

        SimpleWeb::CaseInsensitiveMultimap headers;
        headers.emplace("Content-Type", "application/json");

        response->write(SimpleWeb::StatusCode::success_ok, result.dump(), headers);
    };
}
