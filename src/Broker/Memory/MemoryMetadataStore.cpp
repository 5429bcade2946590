#include "MemoryMetadataStore.h"
#include "../../Lib/RelayErrors.h"

auto MemoryMetadataStore::findLive(const std::string& transferId) -> std::shared_ptr<sStoredRecord> {
    auto iter = records.find(transferId);
    if (iter == records.end()) {
        return nullptr;
    }

    auto stored = iter->second;
    if (stored->isExpired()) {
        // Only remove the exact record we looked at, a new transfer may have claimed the id in the meantime
        records.erase_if_equal(transferId, stored);
        return nullptr;
    }

    return stored;
}

auto MemoryMetadataStore::put(const sTransferRecord& record) -> bool {
    // Clear out any expired record so that it doesn't block the id
    findLive(record.transferId);

    return records.insert(record.transferId, std::make_shared<sStoredRecord>(record)).second;
}

auto MemoryMetadataStore::get(const std::string& transferId) -> sTransferRecord {
    auto stored = findLive(transferId);
    if (!stored) {
        throw eNotFoundError();
    }

    return stored->record;
}

auto MemoryMetadataStore::exists(const std::string& transferId) -> bool {
    return findLive(transferId) != nullptr;
}

auto MemoryMetadataStore::claimReceiver(const std::string& transferId, const std::string& generation) -> bool {
    auto stored = findLive(transferId);
    if (!stored || stored->record.generation != generation) {
        throw eNotFoundError();
    }

    bool expected = false;
    return stored->receiverBound.compare_exchange_strong(expected, true);
}

void MemoryMetadataStore::remove(const std::string& transferId, const std::string& generation) {
    auto iter = records.find(transferId);
    if (iter == records.end()) {
        return;
    }

    auto stored = iter->second;
    if (stored->record.generation == generation) {
        records.erase_if_equal(transferId, stored);
    }
}

auto MemoryMetadataStore::pruneExpired() -> std::vector<sTransferRecord> {
    std::vector<std::pair<std::string, std::shared_ptr<sStoredRecord>>> expired;
    for (const auto& [transferId, stored] : records) {
        if (stored->isExpired()) {
            expired.emplace_back(transferId, stored);
        }
    }

    std::vector<sTransferRecord> pruned;
    for (const auto& [transferId, stored] : expired) {
        if (records.erase_if_equal(transferId, stored) != 0) {
            pruned.push_back(stored->record);
        }
    }

    return pruned;
}
