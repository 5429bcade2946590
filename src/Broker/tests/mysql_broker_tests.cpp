#include "../../Lib/RelayErrors.h"
#include "../../Relay/FileMetadata.h"
#include "../../tests/fixtures/DatabaseFixture.h"
#include "../MySql/MySqlChunkChannel.h"
#include "../MySql/MySqlMetadataStore.h"
#include "../MySql/MySqlReadinessChannel.h"
#include <boost/test/unit_test.hpp>
#include <future>
#include <thread>

using namespace std::chrono_literals;

struct MySqlBrokerFixture : public DatabaseFixture {
    MySqlMetadataStore metadataStore;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    MySqlReadinessChannel readinessChannel = MySqlReadinessChannel(10ms);
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    MySqlChunkChannel chunkChannel = MySqlChunkChannel(100, 10ms);

    static auto makeRecord(const std::string& transferId, std::chrono::milliseconds ttl = 1h) -> sTransferRecord {
        return {
                .transferId = transferId,
                .generation = "gen-" + transferId,
                .metadata = sFileMetadata::create("data.bin", 300, "application/x-test"),
                .createdAt = std::chrono::system_clock::now(),
                .ttl = ttl
        };
    }

    static auto makeChunk(size_t size, uint8_t value = 0) -> StreamItem {
        return sChunk{std::make_shared<std::vector<uint8_t>>(size, value)};
    }
};

// The suite is skipped rather than failed on machines without the relay database
static auto databaseReachable(boost::unit_test::test_unit_id /*unused*/) -> boost::test_tools::assertion_result {
    try {
        MySqlConnector database;
        return true;
    } catch (sqlpp::exception& exception) {
        boost::test_tools::assertion_result result(false);
        result.message() << "The relay database is not reachable: " << exception.what();
        return result;
    }
}

BOOST_FIXTURE_TEST_SUITE(MySqlBroker_test_suite, MySqlBrokerFixture, *boost::unit_test::precondition(databaseReachable))
    BOOST_AUTO_TEST_CASE(test_metadata_store) {
        BOOST_CHECK(!metadataStore.exists("mysql-1"));
        BOOST_CHECK_THROW(metadataStore.get("mysql-1"), eNotFoundError);

        BOOST_CHECK(metadataStore.put(makeRecord("mysql-1")));
        BOOST_CHECK(!metadataStore.put(makeRecord("mysql-1")));

        auto record = metadataStore.get("mysql-1");
        BOOST_CHECK_EQUAL(record.transferId, "mysql-1");
        BOOST_CHECK(record.metadata.equals(sFileMetadata::create("data.bin", 300, "application/x-test")));

        BOOST_CHECK(metadataStore.claimReceiver("mysql-1", "gen-mysql-1"));
        BOOST_CHECK(!metadataStore.claimReceiver("mysql-1", "gen-mysql-1"));

        // Calls for another generation leave the record alone
        BOOST_CHECK_THROW(metadataStore.claimReceiver("mysql-1", "gen-earlier"), eNotFoundError);
        metadataStore.remove("mysql-1", "gen-earlier");
        BOOST_CHECK(metadataStore.exists("mysql-1"));

        metadataStore.remove("mysql-1", "gen-mysql-1");
        BOOST_CHECK(!metadataStore.exists("mysql-1"));
        BOOST_CHECK_THROW(metadataStore.claimReceiver("mysql-1", "gen-mysql-1"), eNotFoundError);
    }

    BOOST_AUTO_TEST_CASE(test_metadata_expiry) {
        BOOST_CHECK(metadataStore.put(makeRecord("mysql-2", 50ms)));
        BOOST_CHECK(metadataStore.put(makeRecord("mysql-3", 50ms)));
        BOOST_CHECK(metadataStore.put(makeRecord("mysql-4")));
        BOOST_CHECK(metadataStore.claimReceiver("mysql-3", "gen-mysql-3"));

        std::this_thread::sleep_for(100ms);

        BOOST_CHECK(!metadataStore.exists("mysql-2"));
        BOOST_CHECK(metadataStore.exists("mysql-3"));

        auto pruned = metadataStore.pruneExpired();
        BOOST_CHECK_EQUAL(pruned.size(), 1);
        BOOST_CHECK_EQUAL(pruned.front().transferId, "mysql-2");
        BOOST_CHECK_EQUAL(pruned.front().generation, "gen-mysql-2");

        BOOST_CHECK(metadataStore.exists("mysql-4"));

        // An expired record doesn't hold the id
        BOOST_CHECK(metadataStore.put(makeRecord("mysql-2")));
    }

    BOOST_AUTO_TEST_CASE(test_readiness_channel) {
        BOOST_CHECK(readinessChannel.open("mysql-5", "gen-1", 1h));
        BOOST_CHECK(!readinessChannel.open("mysql-5", "gen-1", 1h));
        BOOST_CHECK(readinessChannel.isOpen("mysql-5"));

        BOOST_CHECK(!readinessChannel.awaitReady("mysql-5", "gen-1", 50ms));

        auto waiter = std::async(std::launch::async, [this]() {
            return readinessChannel.awaitReady("mysql-5", "gen-1", 5s);
        });

        std::this_thread::sleep_for(50ms);
        BOOST_CHECK(readinessChannel.signalReady("mysql-5", "gen-1"));
        BOOST_CHECK(!readinessChannel.signalReady("mysql-5", "gen-1"));
        BOOST_CHECK(waiter.get());

        readinessChannel.close("mysql-5", "gen-1");
        BOOST_CHECK(!readinessChannel.isOpen("mysql-5"));
        BOOST_CHECK(!readinessChannel.signalReady("mysql-5", "gen-1"));
        BOOST_CHECK(readinessChannel.open("mysql-5", "gen-2", 1h));

        // The earlier generation can't touch the new signal
        BOOST_CHECK(!readinessChannel.signalReady("mysql-5", "gen-1"));
        readinessChannel.close("mysql-5", "gen-1");
        BOOST_CHECK(readinessChannel.isOpen("mysql-5"));
        BOOST_CHECK(readinessChannel.signalReady("mysql-5", "gen-2"));
    }

    BOOST_AUTO_TEST_CASE(test_readiness_takeover) {
        BOOST_CHECK(readinessChannel.open("mysql-6", "gen-1", 50ms));
        std::this_thread::sleep_for(100ms);
        BOOST_CHECK(readinessChannel.open("mysql-6", "gen-2", 1h));
    }

    BOOST_AUTO_TEST_CASE(test_chunk_channel) {
        chunkChannel.open("mysql-7");
        BOOST_CHECK(chunkChannel.exists("mysql-7"));

        BOOST_CHECK(chunkChannel.push("mysql-7", makeChunk(60, 1), 1s) == ePushResult::ok);
        BOOST_CHECK(chunkChannel.push("mysql-7", makeChunk(40, 2), 1s) == ePushResult::ok);
        BOOST_CHECK_EQUAL(chunkChannel.bufferedBytes("mysql-7"), 100);

        // Full
        BOOST_CHECK(chunkChannel.push("mysql-7", makeChunk(1), 50ms) == ePushResult::timedOut);
        BOOST_CHECK(chunkChannel.push("mysql-7", sDone{}, 1s) == ePushResult::ok);
        BOOST_CHECK(chunkChannel.push("mysql-7", makeChunk(1), 1s) == ePushResult::closed);

        auto first = chunkChannel.pop("mysql-7", 1s);
        BOOST_REQUIRE(first.has_value());
        BOOST_CHECK_EQUAL(std::get<sChunk>(*first).data->size(), 60);
        BOOST_CHECK_EQUAL(std::get<sChunk>(*first).data->front(), 1);

        auto second = chunkChannel.pop("mysql-7", 1s);
        BOOST_REQUIRE(second.has_value());
        BOOST_CHECK_EQUAL(std::get<sChunk>(*second).data->size(), 40);
        BOOST_CHECK_EQUAL(std::get<sChunk>(*second).data->front(), 2);

        BOOST_CHECK(chunkChannel.awaitDrained("mysql-7", 50ms) == eDrainResult::timedOut);

        auto done = chunkChannel.pop("mysql-7", 1s);
        BOOST_REQUIRE(done.has_value());
        BOOST_CHECK(std::holds_alternative<sDone>(*done));

        BOOST_CHECK(chunkChannel.awaitDrained("mysql-7", 1s) == eDrainResult::drained);
        BOOST_CHECK_EQUAL(chunkChannel.bufferedBytes("mysql-7"), 0);

        chunkChannel.remove("mysql-7");
        BOOST_CHECK(!chunkChannel.exists("mysql-7"));
    }

    BOOST_AUTO_TEST_CASE(test_chunk_channel_interrupt) {
        chunkChannel.open("mysql-8");
        BOOST_CHECK(!chunkChannel.pop("mysql-8", 50ms).has_value());

        auto popper = std::async(std::launch::async, [this]() {
            return chunkChannel.pop("mysql-8", 5s);
        });

        std::this_thread::sleep_for(50ms);
        chunkChannel.interrupt("mysql-8");

        auto item = popper.get();
        BOOST_REQUIRE(item.has_value());
        BOOST_CHECK(std::holds_alternative<sInterrupt>(*item));

        BOOST_CHECK(chunkChannel.push("mysql-8", makeChunk(1), 1s) == ePushResult::interrupted);
        BOOST_CHECK(chunkChannel.awaitDrained("mysql-8", 1s) == eDrainResult::interrupted);

        // A missing channel reads as interrupted
        chunkChannel.remove("mysql-8");
        auto missing = chunkChannel.pop("mysql-8", 1s);
        BOOST_REQUIRE(missing.has_value());
        BOOST_CHECK(std::holds_alternative<sInterrupt>(*missing));
    }

    BOOST_AUTO_TEST_CASE(test_chunk_channel_keys_are_independent) {
        // Two transfers that shared an id have different channel keys
        chunkChannel.open("mysql-9/gen-1");
        chunkChannel.remove("mysql-9/gen-1");
        chunkChannel.open("mysql-9/gen-2");

        BOOST_CHECK(chunkChannel.push("mysql-9/gen-2", makeChunk(10, 0xAA), 1s) == ePushResult::ok);

        auto stale = chunkChannel.pop("mysql-9/gen-1", 1s);
        BOOST_REQUIRE(stale.has_value());
        BOOST_CHECK(std::holds_alternative<sInterrupt>(*stale));

        chunkChannel.interrupt("mysql-9/gen-1");

        auto current = chunkChannel.pop("mysql-9/gen-2", 1s);
        BOOST_REQUIRE(current.has_value());
        BOOST_CHECK_EQUAL(std::get<sChunk>(*current).data->front(), 0xAA);
    }
BOOST_AUTO_TEST_SUITE_END()
