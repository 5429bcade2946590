//
// In-process metadata store, for single instance deployments and the tests
//

#ifndef TRANSIT_RELAY_MEMORYMETADATASTORE_H
#define TRANSIT_RELAY_MEMORYMETADATASTORE_H

#include "../../Interfaces/IMetadataStore.h"
#include "../../Lib/GeneralUtils.h"
#include "../../Relay/FileMetadata.h"
#include <atomic>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <string>
#include <vector>

class MemoryMetadataStore : public IMetadataStore {
public:
    auto put(const sTransferRecord& record) -> bool override;
    auto get(const std::string& transferId) -> sTransferRecord override;
    auto exists(const std::string& transferId) -> bool override;
    auto claimReceiver(const std::string& transferId, const std::string& generation) -> bool override;
    void remove(const std::string& transferId, const std::string& generation) override;
    auto pruneExpired() -> std::vector<sTransferRecord> override;

private:
    struct sStoredRecord {
        explicit sStoredRecord(sTransferRecord record) : record(std::move(record)) {}

        // Records only expire while they're waiting for a receiver
        [[nodiscard]] auto isExpired() const -> bool {
            return !receiverBound && std::chrono::system_clock::now() >= record.expiresAt();
        }

        const sTransferRecord record;
        std::atomic<bool> receiverBound = false;
    };

    auto findLive(const std::string& transferId) -> std::shared_ptr<sStoredRecord>;

    folly::ConcurrentHashMap<std::string, std::shared_ptr<sStoredRecord>> records;

// Testing
    EXPOSE_PROPERTY_FOR_TESTING_READONLY(records);
};

#endif //TRANSIT_RELAY_MEMORYMETADATASTORE_H
