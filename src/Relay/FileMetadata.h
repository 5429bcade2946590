//
// The description of the file being transferred, and the record the metadata store keeps for each transfer
//

#ifndef TRANSIT_RELAY_FILEMETADATA_H
#define TRANSIT_RELAY_FILEMETADATA_H

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

struct sFileMetadata {
    std::string name;
    uint64_t size = 0;
    std::string mimeType;

    [[nodiscard]] auto equals(const sFileMetadata& other) const -> bool {
        return name == other.name
            and size == other.size
            and mimeType == other.mimeType;
    }

    // Builds and validates metadata. The name is escaped, the mime type defaults to a generic binary type. Throws
    // eValidationError if the result isn't usable.
    static auto create(const std::string& name, uint64_t size, const std::string& mimeType) -> sFileMetadata;

    // Accepts the sender's handshake frame: {"file_name": ..., "file_size": ..., "file_type": ...}
    static auto fromJson(const nlohmann::json& json) -> sFileMetadata;
    static auto fromJsonString(const std::string& json) -> sFileMetadata;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] auto toString() const -> std::string;

    static auto escapeFileName(const std::string& name) -> std::string;

    // Parses a Content-Length style value. Only strictly positive integers are accepted.
    static auto parseLength(const std::string& length) -> uint64_t;
};

struct sTransferRecord {
    std::string transferId;
    // Unique to each transfer, so that an id reused by a later transfer is never confused with this one
    std::string generation;
    sFileMetadata metadata;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::milliseconds ttl{};

    [[nodiscard]] auto expiresAt() const -> std::chrono::system_clock::time_point {
        return createdAt + ttl;
    }

    // The chunk channel of a transfer is keyed by both parts of its identity
    [[nodiscard]] auto channelKey() const -> std::string {
        return transferId + "/" + generation;
    }
};

#endif //TRANSIT_RELAY_FILEMETADATA_H
