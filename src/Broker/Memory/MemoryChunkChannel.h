//
// In-process chunk channel. The queue is bounded by the number of bytes it holds rather than the number of chunks.
//

#ifndef TRANSIT_RELAY_MEMORYCHUNKCHANNEL_H
#define TRANSIT_RELAY_MEMORYCHUNKCHANNEL_H

#include "../../Interfaces/IChunkChannel.h"
#include "../../Lib/GeneralUtils.h"
#include <condition_variable>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <folly/concurrency/UnboundedQueue.h>
#include <memory>
#include <mutex>

class MemoryChunkChannel : public IChunkChannel {
public:
    explicit MemoryChunkChannel(uint64_t capacity);

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
    struct sChannelState {
        mutable std::mutex mutex;
        // Signalled when an item was pushed
        std::condition_variable dataCV;
        // Signalled when capacity was freed, or the Done sentinel was consumed
        std::condition_variable spaceCV;

        // One sender pushes, one receiver pops
        folly::USPSCQueue<StreamItem, false> queue;
        uint64_t bufferedBytes = 0;

        bool interrupted = false;
        bool finished = false;
        bool drained = false;
        bool removed = false;

        [[nodiscard]] auto isInterrupted() const -> bool {
            return interrupted || removed;
        }
    };

    auto find(const std::string& channelKey) -> std::shared_ptr<sChannelState>;
    static void wakeAll(const std::shared_ptr<sChannelState>& state);

    const uint64_t maxBufferedBytes;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<sChannelState>> channels;

// Testing
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(channels);
};

#endif //TRANSIT_RELAY_MEMORYCHUNKCHANNEL_H
