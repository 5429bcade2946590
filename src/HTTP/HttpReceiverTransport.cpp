#include "HttpReceiverTransport.h"
#include "../Lib/RelayErrors.h"
#include "../Relay/FileMetadata.h"
#include <future>

void HttpReceiverTransport::sendMetadata(const sFileMetadata& metadata) {
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", metadata.mimeType);
    headers.emplace("Content-Disposition", "attachment; filename=\"" + metadata.name + "\"");
    headers.emplace("Content-Length", std::to_string(metadata.size));

    // Write the headers
    response->write(headers);
    flush("headers");
}

void HttpReceiverTransport::writeChunk(const std::vector<uint8_t>& data) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    response->write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    flush("content");
}

void HttpReceiverTransport::finish() {
    // The body is complete once Content-Length bytes were written, the server finishes the response
}

void HttpReceiverTransport::abort(const std::string& reason) {
    // The headers are already out, so the only way to report the failure is to cut the body short
    std::cout << "API: Closing download early: " << reason << std::endl;
    response->close_connection_after_response = true;
}

void HttpReceiverTransport::flush(const std::string& what) {
    std::promise<SimpleWeb::error_code> sendPromise;
    response->send([&sendPromise](const SimpleWeb::error_code &errorCode) {
        sendPromise.set_value(errorCode);
    });

    if (auto errorCode = sendPromise.get_future().get()) {
        throw eTransportError(
                "Error transmitting file " + what + " to client. Perhaps client has disconnected? "
                + std::to_string(errorCode.value()) + " " + errorCode.message()
        );
    }
}
