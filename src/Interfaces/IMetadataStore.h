//
// Interface for the per-transfer metadata store
// Each transfer has a single self-expiring record, keyed by transfer id
//

#ifndef TRANSIT_RELAY_I_METADATA_STORE_H
#define TRANSIT_RELAY_I_METADATA_STORE_H

#include "../Relay/FileMetadata.h"
#include <chrono>
#include <string>
#include <vector>

class IMetadataStore {
public:
    virtual ~IMetadataStore() = default;

    // Stores the record unless one already exists (and hasn't expired) for the same transfer id. Returns false if
    // the id was already taken.
    virtual auto put(const sTransferRecord& record) -> bool = 0;

    // Throws eNotFoundError if no live record exists
    virtual auto get(const std::string& transferId) -> sTransferRecord = 0;

    virtual auto exists(const std::string& transferId) -> bool = 0;

    // Atomically marks the record as having a receiver. Returns false if a receiver was already bound, throws
    // eNotFoundError if no live record of that generation exists.
    virtual auto claimReceiver(const std::string& transferId, const std::string& generation) -> bool = 0;

    // Only removes the record if it still belongs to the given generation
    virtual void remove(const std::string& transferId, const std::string& generation) = 0;

    // Removes records that expired before any receiver was bound, and returns them
    virtual auto pruneExpired() -> std::vector<sTransferRecord> = 0;
};

#endif //TRANSIT_RELAY_I_METADATA_STORE_H
