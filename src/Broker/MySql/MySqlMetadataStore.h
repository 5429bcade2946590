//
// Metadata store backed by the relay_transfer table
//

#ifndef TRANSIT_RELAY_MYSQLMETADATASTORE_H
#define TRANSIT_RELAY_MYSQLMETADATASTORE_H

#include "../../Interfaces/IMetadataStore.h"

class MySqlMetadataStore : public IMetadataStore {
public:
    auto put(const sTransferRecord& record) -> bool override;
    auto get(const std::string& transferId) -> sTransferRecord override;
    auto exists(const std::string& transferId) -> bool override;
    auto claimReceiver(const std::string& transferId, const std::string& generation) -> bool override;
    void remove(const std::string& transferId, const std::string& generation) override;
    auto pruneExpired() -> std::vector<sTransferRecord> override;
};

#endif //TRANSIT_RELAY_MYSQLMETADATASTORE_H
