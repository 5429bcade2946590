//
// Interface for the bounded, ordered queue that carries a transfer's bytes from the sender to the receiver
// Channels are keyed by sTransferRecord::channelKey(), so every transfer gets its own channel even if its id is reused
//

#ifndef TRANSIT_RELAY_I_CHUNK_CHANNEL_H
#define TRANSIT_RELAY_I_CHUNK_CHANNEL_H

#include "../Relay/StreamItem.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

enum class ePushResult {
    ok,
    // The channel was interrupted or removed
    interrupted,
    // A Done sentinel was already pushed
    closed,
    // No capacity became available in time
    timedOut
};

enum class eDrainResult {
    drained,
    interrupted,
    timedOut
};

class IChunkChannel {
public:
    virtual ~IChunkChannel() = default;

    virtual void open(const std::string& channelKey) = 0;

    // Blocks while the channel doesn't have capacity for the chunk. Sentinels never block, and pushing an Interrupt
    // is the same as calling interrupt().
    virtual auto push(const std::string& channelKey, const StreamItem& item, std::chrono::milliseconds timeout) -> ePushResult = 0;

    // Blocks until an item is available. Returns an empty optional on timeout, and an Interrupt once the channel is
    // interrupted or no longer exists.
    virtual auto pop(const std::string& channelKey, std::chrono::milliseconds timeout) -> std::optional<StreamItem> = 0;

    virtual void interrupt(const std::string& channelKey) = 0;

    // Waits for the consumer to pop the Done sentinel
    virtual auto awaitDrained(const std::string& channelKey, std::chrono::milliseconds timeout) -> eDrainResult = 0;

    virtual auto bufferedBytes(const std::string& channelKey) -> uint64_t = 0;

    virtual auto capacity() const -> uint64_t = 0;

    virtual auto exists(const std::string& channelKey) -> bool = 0;

    // Wakes anything still blocked on the channel, then discards it
    virtual void remove(const std::string& channelKey) = 0;
};

#endif //TRANSIT_RELAY_I_CHUNK_CHANNEL_H
