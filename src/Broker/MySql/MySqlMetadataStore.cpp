#include "MySqlMetadataStore.h"
#include "../../DB/MySqlConnector.h"
#include "../../Lib/RelayErrors.h"
#include "../../Relay/FileMetadata.h"
#include "relay_schema.h"

using namespace sqlpp;

template<typename Row>
static auto recordFromRow(const Row& row) -> sTransferRecord {
    return sTransferRecord{
            .transferId = row.transferId,
            .generation = row.generation,
            .metadata = {
                    .name = row.fileName,
                    .size = static_cast<uint64_t>(row.fileSize),
                    .mimeType = row.mimeType
            },
            .createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(row.createdAt)),
            .ttl = std::chrono::milliseconds(row.ttl)
    };
}

auto MySqlMetadataStore::put(const sTransferRecord& record) -> bool {
    auto _database = MySqlConnector();
    schema::RelayTransfer _transferTable;

    // A record that expired before a receiver arrived no longer holds the id
    _database->run(
            remove_from(_transferTable)
                    .where(
                            _transferTable.transferId == record.transferId
                            and _transferTable.receiverBound == 0
                            and _transferTable.createdAt + _transferTable.ttl <= epochMilliseconds()
                    )
    );

    try {
        _database->run(
                insert_into(_transferTable)
                        .set(
                                _transferTable.transferId = record.transferId,
                                _transferTable.generation = record.generation,
                                _transferTable.fileName = record.metadata.name,
                                _transferTable.fileSize = static_cast<int64_t>(record.metadata.size),
                                _transferTable.mimeType = record.metadata.mimeType,
                                _transferTable.createdAt = epochMilliseconds(record.createdAt),
                                _transferTable.ttl = static_cast<int64_t>(record.ttl.count()),
                                _transferTable.receiverBound = 0
                        )
        );
    } catch (sqlpp::exception& exception) {
        if (isDuplicateKeyError(exception)) {
            return false;
        }
        throw;
    }

    return true;
}

auto MySqlMetadataStore::get(const std::string& transferId) -> sTransferRecord {
    auto _database = MySqlConnector();
    schema::RelayTransfer _transferTable;

    auto results = _database->operator()(
            select(all_of(_transferTable))
                    .from(_transferTable)
                    .where(_transferTable.transferId == transferId)
    );

    if (results.empty()) {
        throw eNotFoundError();
    }

    const auto& row = results.front();
    auto record = recordFromRow(row);

    if (row.receiverBound == 0 && std::chrono::system_clock::now() >= record.expiresAt()) {
        throw eNotFoundError();
    }

    return record;
}

auto MySqlMetadataStore::exists(const std::string& transferId) -> bool {
    try {
        get(transferId);
        return true;
    } catch (eNotFoundError&) {
        return false;
    }
}

auto MySqlMetadataStore::claimReceiver(const std::string& transferId, const std::string& generation) -> bool {
    auto _database = MySqlConnector();
    schema::RelayTransfer _transferTable;

    auto updated = _database->run(
            update(_transferTable)
                    .set(_transferTable.receiverBound = 1)
                    .where(
                            _transferTable.transferId == transferId
                            and _transferTable.generation == generation
                            and _transferTable.receiverBound == 0
                            and _transferTable.createdAt + _transferTable.ttl > epochMilliseconds()
                    )
    );

    if (updated == 1) {
        return true;
    }

    // Either another receiver won, or there is no live record of this generation. get() throws if there is no live
    // record at all.
    if (get(transferId).generation != generation) {
        throw eNotFoundError();
    }
    return false;
}

void MySqlMetadataStore::remove(const std::string& transferId, const std::string& generation) {
    auto _database = MySqlConnector();
    schema::RelayTransfer _transferTable;

    _database->run(
            remove_from(_transferTable)
                    .where(
                            _transferTable.transferId == transferId
                            and _transferTable.generation == generation
                    )
    );
}

auto MySqlMetadataStore::pruneExpired() -> std::vector<sTransferRecord> {
    auto _database = MySqlConnector();
    schema::RelayTransfer _transferTable;

    auto now = epochMilliseconds();
    auto results = _database->operator()(
            select(all_of(_transferTable))
                    .from(_transferTable)
                    .where(
                            _transferTable.receiverBound == 0
                            and _transferTable.createdAt + _transferTable.ttl <= now
                    )
    );

    std::vector<sTransferRecord> candidates;
    for (const auto& row : results) {
        candidates.push_back(recordFromRow(row));
    }

    // A receiver may have claimed the record between the select and the delete, so only report the records that
    // were really removed
    std::vector<sTransferRecord> pruned;
    for (const auto& record : candidates) {
        auto removed = _database->run(
                remove_from(_transferTable)
                        .where(
                                _transferTable.transferId == record.transferId
                                and _transferTable.generation == record.generation
                                and _transferTable.receiverBound == 0
                                and _transferTable.createdAt + _transferTable.ttl <= now
                        )
        );

        if (removed == 1) {
            pruned.push_back(record);
        }
    }

    return pruned;
}
