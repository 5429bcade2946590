//
// The connection a receiver adapter streams the file out through
//

#ifndef TRANSIT_RELAY_I_RECEIVER_TRANSPORT_H
#define TRANSIT_RELAY_I_RECEIVER_TRANSPORT_H

#include <cstdint>
#include <string>
#include <vector>

struct sFileMetadata;

class IReceiverTransport {
public:
    virtual ~IReceiverTransport() = default;

    // Announces the file before any data is written
    virtual void sendMetadata(const sFileMetadata& metadata) = 0;

    // Blocks until the chunk was handed to the connection. Throws eTransportError if the connection failed.
    virtual void writeChunk(const std::vector<uint8_t>& data) = 0;

    // Ends a complete stream
    virtual void finish() = 0;

    // Ends the stream early
    virtual void abort(const std::string& reason) = 0;
};

#endif //TRANSIT_RELAY_I_RECEIVER_TRANSPORT_H
