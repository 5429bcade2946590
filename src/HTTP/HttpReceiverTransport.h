//
// Streams a file out as the body of an http response
//

#ifndef TRANSIT_RELAY_HTTPRECEIVERTRANSPORT_H
#define TRANSIT_RELAY_HTTPRECEIVERTRANSPORT_H

#include "../Interfaces/IReceiverTransport.h"
#include "HttpServer.h"
#include <memory>

class HttpReceiverTransport : public IReceiverTransport {
public:
    explicit HttpReceiverTransport(std::shared_ptr<HttpServerImpl::Response> response) : response(std::move(response)) {}

    void sendMetadata(const sFileMetadata& metadata) override;
    void writeChunk(const std::vector<uint8_t>& data) override;
    void finish() override;
    void abort(const std::string& reason) override;

private:
    // Waits for the buffered response data to be written to the socket
    void flush(const std::string& what);

    std::shared_ptr<HttpServerImpl::Response> response;
};

#endif //TRANSIT_RELAY_HTTPRECEIVERTRANSPORT_H
