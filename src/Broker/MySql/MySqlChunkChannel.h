//
// Chunk channel backed by the relay_channel and relay_chunk tables, so that the sender and the receiver of a
// transfer may be served by different processes. Blocking calls poll.
//

#ifndef TRANSIT_RELAY_MYSQLCHUNKCHANNEL_H
#define TRANSIT_RELAY_MYSQLCHUNKCHANNEL_H

#include "../../Interfaces/IChunkChannel.h"

class MySqlChunkChannel : public IChunkChannel {
public:
    MySqlChunkChannel(uint64_t capacity, std::chrono::milliseconds pollInterval);

    void open(const std::string& channelKey) override;
    auto push(const std::string& channelKey, const StreamItem& item, std::chrono::milliseconds timeout) -> ePushResult override;
    auto pop(const std::string& channelKey, std::chrono::milliseconds timeout) -> std::optional<StreamItem> override;
    void interrupt(const std::string& channelKey) override;
    auto awaitDrained(const std::string& channelKey, std::chrono::milliseconds timeout) -> eDrainResult override;
    auto bufferedBytes(const std::string& channelKey) -> uint64_t override;
    auto exists(const std::string& channelKey) -> bool override;
    void remove(const std::string& channelKey) override;

    auto capacity() const -> uint64_t override {
        return maxBufferedBytes;
    }

private:
    // Values of relay_chunk.kind
    static constexpr int64_t KIND_CHUNK = 0;
    static constexpr int64_t KIND_DONE = 1;

    const uint64_t maxBufferedBytes;
    const std::chrono::milliseconds pollInterval;
};

#endif //TRANSIT_RELAY_MYSQLCHUNKCHANNEL_H
