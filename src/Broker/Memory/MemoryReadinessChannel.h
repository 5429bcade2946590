//
// In-process readiness signal
//

#ifndef TRANSIT_RELAY_MEMORYREADINESSCHANNEL_H
#define TRANSIT_RELAY_MEMORYREADINESSCHANNEL_H

#include "../../Interfaces/IReadinessChannel.h"
#include <condition_variable>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <mutex>
#include <string>

class MemoryReadinessChannel : public IReadinessChannel {
public:
    auto open(const std::string& transferId, const std::string& generation, std::chrono::milliseconds lifetime) -> bool override;
    auto awaitReady(const std::string& transferId, const std::string& generation, std::chrono::milliseconds timeout) -> bool override;
    auto signalReady(const std::string& transferId, const std::string& generation) -> bool override;
    auto isOpen(const std::string& transferId) -> bool override;
    void close(const std::string& transferId, const std::string& generation) override;

private:
    struct sReadinessState {
        sReadinessState(std::string generation, std::chrono::steady_clock::time_point expiresAt) :
                generation(std::move(generation)), expiresAt(expiresAt) {}

        mutable std::mutex mutex;
        std::condition_variable signalCV;
        bool signaled = false;
        bool closed = false;
        const std::string generation;
        const std::chrono::steady_clock::time_point expiresAt;
    };

    // Returns the signal only if it was opened by the given generation
    auto find(const std::string& transferId, const std::string& generation) -> std::shared_ptr<sReadinessState>;

    folly::ConcurrentHashMap<std::string, std::shared_ptr<sReadinessState>> signals;
};

#endif //TRANSIT_RELAY_MEMORYREADINESSCHANNEL_H
