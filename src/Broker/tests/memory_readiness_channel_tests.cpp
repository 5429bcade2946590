#include "../Memory/MemoryReadinessChannel.h"
#include <boost/test/unit_test.hpp>
#include <future>
#include <thread>

using namespace std::chrono_literals;

BOOST_AUTO_TEST_SUITE(MemoryReadinessChannel_test_suite)
    BOOST_AUTO_TEST_CASE(test_open_claims_id) {
        MemoryReadinessChannel channel;

        BOOST_CHECK(!channel.isOpen("ready-1"));
        BOOST_CHECK(channel.open("ready-1", "gen-1", 1h));
        BOOST_CHECK(channel.isOpen("ready-1"));

        // The id is in use until the signal is closed
        BOOST_CHECK(!channel.open("ready-1", "gen-1", 1h));

        channel.close("ready-1", "gen-1");
        BOOST_CHECK(!channel.isOpen("ready-1"));
        BOOST_CHECK(channel.open("ready-1", "gen-2", 1h));
    }

    BOOST_AUTO_TEST_CASE(test_stale_signal_taken_over) {
        MemoryReadinessChannel channel;

        BOOST_CHECK(channel.open("ready-2", "gen-1", 50ms));

        auto waiter = std::async(std::launch::async, [&channel]() {
            return channel.awaitReady("ready-2", "gen-1", 5s);
        });

        std::this_thread::sleep_for(100ms);

        // The lifetime passed, so the id can be claimed again and the old waiter is released
        BOOST_CHECK(channel.open("ready-2", "gen-2", 1h));
        BOOST_CHECK(waiter.wait_for(1s) == std::future_status::ready);
        BOOST_CHECK(!waiter.get());
    }

    BOOST_AUTO_TEST_CASE(test_signal_before_wait) {
        MemoryReadinessChannel channel;
        channel.open("ready-3", "gen-1", 1h);

        BOOST_CHECK(channel.signalReady("ready-3", "gen-1"));
        BOOST_CHECK(channel.awaitReady("ready-3", "gen-1", 50ms));

        // The signal is one shot
        BOOST_CHECK(!channel.signalReady("ready-3", "gen-1"));
    }

    BOOST_AUTO_TEST_CASE(test_signal_wakes_waiter) {
        MemoryReadinessChannel channel;
        channel.open("ready-4", "gen-1", 1h);

        auto waiter = std::async(std::launch::async, [&channel]() {
            return channel.awaitReady("ready-4", "gen-1", 5s);
        });

        BOOST_CHECK(waiter.wait_for(100ms) == std::future_status::timeout);
        BOOST_CHECK(channel.signalReady("ready-4", "gen-1"));
        BOOST_CHECK(waiter.get());
    }

    BOOST_AUTO_TEST_CASE(test_wait_timeout) {
        MemoryReadinessChannel channel;
        channel.open("ready-5", "gen-1", 1h);

        auto start = std::chrono::steady_clock::now();
        BOOST_CHECK(!channel.awaitReady("ready-5", "gen-1", 50ms));
        BOOST_CHECK(std::chrono::steady_clock::now() - start >= 50ms);
    }

    BOOST_AUTO_TEST_CASE(test_close_wakes_waiter) {
        MemoryReadinessChannel channel;
        channel.open("ready-6", "gen-1", 1h);

        auto waiter = std::async(std::launch::async, [&channel]() {
            return channel.awaitReady("ready-6", "gen-1", 5s);
        });

        std::this_thread::sleep_for(50ms);
        channel.close("ready-6", "gen-1");

        BOOST_CHECK(waiter.wait_for(1s) == std::future_status::ready);
        BOOST_CHECK(!waiter.get());
    }

    BOOST_AUTO_TEST_CASE(test_missing_signal) {
        MemoryReadinessChannel channel;

        BOOST_CHECK(!channel.signalReady("missing", "gen-1"));
        BOOST_CHECK(!channel.awaitReady("missing", "gen-1", 10ms));
        BOOST_CHECK_NO_THROW(channel.close("missing", "gen-1"));
    }

    BOOST_AUTO_TEST_CASE(test_other_generation_ignored) {
        MemoryReadinessChannel channel;
        channel.open("ready-7", "gen-2", 1h);

        auto waiter = std::async(std::launch::async, [&channel]() {
            return channel.awaitReady("ready-7", "gen-2", 5s);
        });

        // A session from an earlier transfer on the same id can neither raise nor close the signal
        BOOST_CHECK(!channel.signalReady("ready-7", "gen-1"));
        channel.close("ready-7", "gen-1");
        BOOST_CHECK(!channel.awaitReady("ready-7", "gen-1", 10ms));

        BOOST_CHECK(channel.isOpen("ready-7"));
        BOOST_CHECK(waiter.wait_for(100ms) == std::future_status::timeout);

        BOOST_CHECK(channel.signalReady("ready-7", "gen-2"));
        BOOST_CHECK(waiter.get());
    }
BOOST_AUTO_TEST_SUITE_END()
