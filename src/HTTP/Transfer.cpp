//
// Transfer endpoints: GET /{id} downloads a file, PUT /{id}/{filename} uploads one
//

#include "../Relay/ReceiverAdapter.h"
#include "../Relay/SenderAdapter.h"
#include "HttpReceiverTransport.h"
#include "HttpServer.h"
#include "HttpUtils.h"

// Everything but the health check. Ids with other characters are rejected by the handlers rather than the route, so
// that they get a 400 instead of a 404.
static const std::string TRANSFER_ID_ROUTE = "^/(?!health/?$)([^/]+)";

void TransferApi(HttpServer *server) {
    // Get      -> Receive the file of a transfer (transfer id)
    // Put      -> Send a file (transfer id, file name)

    server->getServer().resource[TRANSFER_ID_ROUTE + "/?$"]["GET"] = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto transferId = request->path_match[1].str();

        auto transport = std::make_shared<HttpReceiverTransport>(response);
        auto adapter = ReceiverAdapter(server->getBroker(), server->getSettings(), transferId, transport);

        try {
            // The response headers go out with the metadata, so the sender is released first
            adapter.open(true);
        } catch (eRelayError& error) {
            std::cout << "API: Rejected download of " << transferId << ": " << error.what() << std::endl;
            response->write(statusCodeFor(error), error.clientMessage());
            return;
        }

        try {
            adapter.run();
        } catch (std::exception& e) {
            dumpExceptions(e);

            adapter.handleDisconnect();
            response->close_connection_after_response = true;
        }
    };

    auto upload = [server](
            const std::shared_ptr<HttpServerImpl::Response> &response,
            const std::shared_ptr<HttpServerImpl::Request> &request) {

        auto transferId = request->path_match[1].str();

        try {
            // The file name comes either from the path or the query string
            std::string fileName;
            if (request->path_match.size() > 2 && request->path_match[2].matched) {
                fileName = SimpleWeb::Percent::decode(request->path_match[2].str());
            } else {
                auto query = request->parse_query_string();
                if (hasQueryParam(query, "filename")) {
                    fileName = getQueryParamAsString(query, "filename");
                }
            }

            if (fileName.empty()) {
                throw eValidationError("Invalid file metadata: a file name is required.");
            }

            auto fileSize = sFileMetadata::parseLength(getHeader(request->header, "Content-Length"));

            auto maxSize = server->getSettings().httpUploadMaxSize;
            if (fileSize > maxSize) {
                response->write(
                        SimpleWeb::StatusCode::client_error_payload_too_large,
                        "Error: File too large. " + std::to_string(maxSize / (1024 * 1024)) + "MiB maximum for HTTP."
                );
                return;
            }

            auto metadata = sFileMetadata::create(fileName, fileSize, getHeader(request->header, "Content-Type"));

            std::cout << "API: Upload of " << metadata.toString() << " to " << transferId << std::endl;

            // Nothing is reported back while the transfer runs, only the final response
            auto adapter = SenderAdapter(server->getBroker(), server->getSettings(), transferId, nullptr);
            adapter.transferBlocking(metadata, request->content);

            response->write(SimpleWeb::StatusCode::success_ok, "Transfer complete.");
        } catch (eRelayError& error) {
            std::cout << "API: Upload to " << transferId << " failed: " << error.what() << std::endl;
            response->write(statusCodeFor(error), error.clientMessage());
        }
    };

    server->getServer().resource[TRANSFER_ID_ROUTE + "/([^/]+)$"]["PUT"] = upload;
    server->getServer().resource[TRANSFER_ID_ROUTE + "/?$"]["PUT"] = upload;
}
