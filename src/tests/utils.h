#ifndef TRANSIT_RELAY_TEST_UTILS_H
#define TRANSIT_RELAY_TEST_UTILS_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <limits>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <client_http.hpp>
#include <client_ws.hpp>

#include "../Settings.h"

auto randomInt(uint64_t start, uint64_t end) -> uint64_t;
auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>;

// Settings with short timeouts and a small channel, so that backpressure and expiry are quick to reach
auto testSettings() -> sRelaySettings;

// Polls the condition until it holds or the timeout passes
template<class Predicate>
auto waitFor(Predicate condition, std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!condition()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

using TestWsClient = SimpleWeb::SocketClient<SimpleWeb::WS>;
using TestHttpClient  = SimpleWeb::Client<SimpleWeb::HTTP>;

#endif  // TRANSIT_RELAY_TEST_UTILS_H
