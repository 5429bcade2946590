#include "MemoryReadinessChannel.h"

auto MemoryReadinessChannel::find(const std::string& transferId, const std::string& generation) -> std::shared_ptr<sReadinessState> {
    auto iter = signals.find(transferId);
    if (iter == signals.end() || iter->second->generation != generation) {
        return nullptr;
    }
    return iter->second;
}

auto MemoryReadinessChannel::open(const std::string& transferId, const std::string& generation, std::chrono::milliseconds lifetime) -> bool {
    auto iter = signals.find(transferId);
    if (iter != signals.end()) {
        auto existing = iter->second;
        if (std::chrono::steady_clock::now() < existing->expiresAt) {
            // The id is in use
            return false;
        }

        // The previous owner never cleaned up, release anyone still waiting on it and take the id over
        {
            std::unique_lock<std::mutex> lock(existing->mutex);
            existing->closed = true;
        }
        existing->signalCV.notify_all();
        signals.erase_if_equal(transferId, existing);
    }

    auto state = std::make_shared<sReadinessState>(generation, std::chrono::steady_clock::now() + lifetime);
    return signals.insert(transferId, state).second;
}

auto MemoryReadinessChannel::awaitReady(const std::string& transferId, const std::string& generation, std::chrono::milliseconds timeout) -> bool {
    auto state = find(transferId, generation);
    if (!state) {
        return false;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    state->signalCV.wait_for(lock, timeout, [&state] { return state->signaled || state->closed; });
    return state->signaled && !state->closed;
}

auto MemoryReadinessChannel::signalReady(const std::string& transferId, const std::string& generation) -> bool {
    auto state = find(transferId, generation);
    if (!state) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        if (state->closed || state->signaled) {
            return false;
        }

        state->signaled = true;
    }

    state->signalCV.notify_all();
    return true;
}

auto MemoryReadinessChannel::isOpen(const std::string& transferId) -> bool {
    auto iter = signals.find(transferId);
    if (iter == signals.end()) {
        return false;
    }

    std::unique_lock<std::mutex> lock(iter->second->mutex);
    return !iter->second->closed;
}

void MemoryReadinessChannel::close(const std::string& transferId, const std::string& generation) {
    auto state = find(transferId, generation);
    if (!state) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->closed = true;
    }
    state->signalCV.notify_all();

    signals.erase_if_equal(transferId, state);
}
