//
// The values that travel through a chunk channel
//

#ifndef TRANSIT_RELAY_STREAMITEM_H
#define TRANSIT_RELAY_STREAMITEM_H

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

struct sChunk {
    std::shared_ptr<std::vector<uint8_t>> data;
};

// Clean end of stream, pushed by the sender after the last chunk
struct sDone {};

// Abnormal end of stream, raised by whichever side failed
struct sInterrupt {};

using StreamItem = std::variant<sChunk, sDone, sInterrupt>;

// Sentinels don't occupy any channel capacity
inline auto streamItemSize(const StreamItem& item) -> uint64_t {
    if (const auto* chunk = std::get_if<sChunk>(&item)) {
        return chunk->data ? chunk->data->size() : 0;
    }
    return 0;
}

inline auto isSentinel(const StreamItem& item) -> bool {
    return !std::holds_alternative<sChunk>(item);
}

#endif //TRANSIT_RELAY_STREAMITEM_H
