#include "MemoryChunkChannel.h"
#include <stdexcept>

MemoryChunkChannel::MemoryChunkChannel(uint64_t capacity) : maxBufferedBytes(capacity) {
    if (maxBufferedBytes == 0) {
        throw std::invalid_argument("Chunk channel capacity must be greater than zero");
    }
}

auto MemoryChunkChannel::find(const std::string& channelKey) -> std::shared_ptr<sChannelState> {
    auto iter = channels.find(channelKey);
    if (iter == channels.end()) {
        return nullptr;
    }
    return iter->second;
}

void MemoryChunkChannel::wakeAll(const std::shared_ptr<sChannelState>& state) {
    state->dataCV.notify_all();
    state->spaceCV.notify_all();
}

void MemoryChunkChannel::open(const std::string& channelKey) {
    auto state = std::make_shared<sChannelState>();

    // Any channel left behind under the same key is stale, release anything that is still blocked on it
    auto iter = channels.find(channelKey);
    if (iter != channels.end()) {
        auto stale = iter->second;
        {
            std::unique_lock<std::mutex> lock(stale->mutex);
            stale->removed = true;
        }
        wakeAll(stale);
    }

    channels.insert_or_assign(channelKey, state);
}

auto MemoryChunkChannel::push(const std::string& channelKey, const StreamItem& item, std::chrono::milliseconds timeout) -> ePushResult {
    if (std::holds_alternative<sInterrupt>(item)) {
        interrupt(channelKey);
        return ePushResult::ok;
    }

    auto state = find(channelKey);
    if (!state) {
        return ePushResult::interrupted;
    }

    auto size = streamItemSize(item);

    {
        std::unique_lock<std::mutex> lock(state->mutex);

        if (state->finished) {
            return ePushResult::closed;
        }

        // Wait for the receiver to drain enough of the queue. A chunk larger than the whole capacity is still let
        // through once the queue is empty, otherwise it could never be delivered.
        auto hasSpace = state->spaceCV.wait_for(lock, timeout, [this, &state, size] {
            return state->isInterrupted()
                || state->bufferedBytes + size <= maxBufferedBytes
                || state->bufferedBytes == 0;
        });

        if (state->isInterrupted()) {
            return ePushResult::interrupted;
        }

        if (!hasSpace) {
            return ePushResult::timedOut;
        }

        state->queue.enqueue(item);
        state->bufferedBytes += size;

        if (std::holds_alternative<sDone>(item)) {
            state->finished = true;
        }
    }

    state->dataCV.notify_one();
    return ePushResult::ok;
}

auto MemoryChunkChannel::pop(const std::string& channelKey, std::chrono::milliseconds timeout) -> std::optional<StreamItem> {
    auto state = find(channelKey);
    if (!state) {
        return sInterrupt{};
    }

    std::optional<StreamItem> result;
    {
        std::unique_lock<std::mutex> lock(state->mutex);

        auto hasData = state->dataCV.wait_for(lock, timeout, [&state] {
            return state->isInterrupted() || !state->queue.empty();
        });

        // An interrupt overrides anything that is still queued
        if (state->isInterrupted()) {
            return sInterrupt{};
        }

        if (!hasData) {
            return std::nullopt;
        }

        auto item = state->queue.try_dequeue();
        if (!item) {
            return std::nullopt;
        }

        state->bufferedBytes -= streamItemSize(*item);

        if (std::holds_alternative<sDone>(*item)) {
            state->drained = true;
        }

        result = std::move(*item);
    }

    state->spaceCV.notify_all();
    return result;
}

void MemoryChunkChannel::interrupt(const std::string& channelKey) {
    auto state = find(channelKey);
    if (!state) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->interrupted = true;
    }
    wakeAll(state);
}

auto MemoryChunkChannel::awaitDrained(const std::string& channelKey, std::chrono::milliseconds timeout) -> eDrainResult {
    auto state = find(channelKey);
    if (!state) {
        return eDrainResult::interrupted;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->spaceCV.wait_for(lock, timeout, [&state] {
        return state->drained || state->isInterrupted();
    });

    if (state->drained) {
        return eDrainResult::drained;
    }

    return state->isInterrupted() ? eDrainResult::interrupted : eDrainResult::timedOut;
}

auto MemoryChunkChannel::bufferedBytes(const std::string& channelKey) -> uint64_t {
    auto state = find(channelKey);
    if (!state) {
        return 0;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    return state->bufferedBytes;
}

auto MemoryChunkChannel::exists(const std::string& channelKey) -> bool {
    return channels.find(channelKey) != channels.end();
}

void MemoryChunkChannel::remove(const std::string& channelKey) {
    auto state = find(channelKey);
    if (!state) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->removed = true;

        // Release the buffered chunks
        while (state->queue.try_dequeue()) {}
        state->bufferedBytes = 0;
    }
    wakeAll(state);

    channels.erase_if_equal(channelKey, state);
}
