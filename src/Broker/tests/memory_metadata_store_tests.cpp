#include "../../Lib/RelayErrors.h"
#include "../Memory/MemoryMetadataStore.h"
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <atomic>
#include <thread>

using namespace std::chrono_literals;

static auto makeRecord(const std::string& transferId, std::chrono::milliseconds ttl = 1h) -> sTransferRecord {
    return {
            .transferId = transferId,
            .generation = "gen-" + transferId,
            .metadata = sFileMetadata::create("data.bin", 1234, "application/x-test"),
            .createdAt = std::chrono::system_clock::now(),
            .ttl = ttl
    };
}

BOOST_AUTO_TEST_SUITE(MemoryMetadataStore_test_suite)
    BOOST_AUTO_TEST_CASE(test_put_and_get) {
        MemoryMetadataStore store;

        BOOST_CHECK(!store.exists("store-1"));
        BOOST_CHECK(store.put(makeRecord("store-1")));
        BOOST_CHECK(store.exists("store-1"));

        auto record = store.get("store-1");
        BOOST_CHECK_EQUAL(record.transferId, "store-1");
        BOOST_CHECK(record.metadata.equals(sFileMetadata::create("data.bin", 1234, "application/x-test")));
        BOOST_CHECK_EQUAL(record.generation, "gen-store-1");
        BOOST_CHECK_EQUAL(record.channelKey(), "store-1/gen-store-1");
        BOOST_CHECK(record.ttl == 1h);
    }

    BOOST_AUTO_TEST_CASE(test_put_if_absent) {
        MemoryMetadataStore store;

        BOOST_CHECK(store.put(makeRecord("store-2")));

        auto second = makeRecord("store-2");
        second.metadata.name = "other.bin";
        BOOST_CHECK(!store.put(second));

        // The first record is untouched
        BOOST_CHECK_EQUAL(store.get("store-2").metadata.name, "data.bin");
    }

    BOOST_AUTO_TEST_CASE(test_get_missing) {
        MemoryMetadataStore store;

        BOOST_CHECK_THROW(store.get("missing"), eNotFoundError);
        BOOST_CHECK_THROW(store.claimReceiver("missing", "gen-missing"), eNotFoundError);
    }

    BOOST_AUTO_TEST_CASE(test_claim_receiver) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-3"));

        BOOST_CHECK(store.claimReceiver("store-3", "gen-store-3"));
        BOOST_CHECK(!store.claimReceiver("store-3", "gen-store-3"));
        BOOST_CHECK(!store.claimReceiver("store-3", "gen-store-3"));
    }

    BOOST_AUTO_TEST_CASE(test_claim_receiver_concurrently) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-4"));

        std::atomic<uint32_t> claimed = 0;
        std::vector<std::thread> threads;
        for (auto index = 0; index < 8; index++) {
            threads.emplace_back([&]() {
                if (store.claimReceiver("store-4", "gen-store-4")) {
                    claimed++;
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        BOOST_CHECK_EQUAL(claimed, 1);
    }

    BOOST_AUTO_TEST_CASE(test_expiry) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-5", 50ms));

        BOOST_CHECK(store.exists("store-5"));

        std::this_thread::sleep_for(100ms);

        BOOST_CHECK(!store.exists("store-5"));
        BOOST_CHECK_THROW(store.get("store-5"), eNotFoundError);

        // An expired record doesn't block the id
        BOOST_CHECK(store.put(makeRecord("store-5")));
    }

    BOOST_AUTO_TEST_CASE(test_bound_record_does_not_expire) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-6", 50ms));
        BOOST_CHECK(store.claimReceiver("store-6", "gen-store-6"));

        std::this_thread::sleep_for(100ms);

        BOOST_CHECK(store.exists("store-6"));
        BOOST_CHECK(store.pruneExpired().empty());
    }

    BOOST_AUTO_TEST_CASE(test_prune) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-7", 50ms));
        store.put(makeRecord("store-8", 50ms));
        store.put(makeRecord("store-9"));

        std::this_thread::sleep_for(100ms);

        std::vector<std::string> pruned;
        for (const auto& record : store.pruneExpired()) {
            pruned.push_back(record.transferId);
            BOOST_CHECK_EQUAL(record.generation, "gen-" + record.transferId);
        }
        std::sort(pruned.begin(), pruned.end());

        BOOST_CHECK_EQUAL(pruned.size(), 2);
        BOOST_CHECK_EQUAL(pruned[0], "store-7");
        BOOST_CHECK_EQUAL(pruned[1], "store-8");

        BOOST_CHECK(store.exists("store-9"));
        BOOST_CHECK_EQUAL(store.getrecords()->size(), 1);

        BOOST_CHECK(store.pruneExpired().empty());
    }

    BOOST_AUTO_TEST_CASE(test_remove) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-10"));

        store.remove("store-10", "gen-store-10");
        BOOST_CHECK(!store.exists("store-10"));

        // Removing twice is fine
        BOOST_CHECK_NO_THROW(store.remove("store-10", "gen-store-10"));
    }

    BOOST_AUTO_TEST_CASE(test_other_generation_ignored) {
        MemoryMetadataStore store;
        store.put(makeRecord("store-11"));

        // Calls made for an earlier transfer on the same id leave the current record alone
        BOOST_CHECK_THROW(store.claimReceiver("store-11", "gen-earlier"), eNotFoundError);
        store.remove("store-11", "gen-earlier");
        BOOST_CHECK(store.exists("store-11"));

        BOOST_CHECK(store.claimReceiver("store-11", "gen-store-11"));
    }
BOOST_AUTO_TEST_SUITE_END()
