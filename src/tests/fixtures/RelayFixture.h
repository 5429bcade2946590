//
// A fresh in-memory broker for every test
//

#ifndef TRANSIT_RELAY_RELAYFIXTURE_H
#define TRANSIT_RELAY_RELAYFIXTURE_H

#include "../../Broker/Broker.h"
#include "../../Broker/Memory/MemoryChunkChannel.h"
#include "../utils.h"

// True if a chunk channel of any transfer on this id is still open in the in-memory broker
inline auto hasChannelFor(const std::shared_ptr<sBroker>& broker, const std::string& transferId) -> bool {
    auto channel = std::dynamic_pointer_cast<MemoryChunkChannel>(broker->chunkChannel);
    for (const auto& [channelKey, state] : *channel->getchannels()) {
        if (channelKey.starts_with(transferId + "/")) {
            return true;
        }
    }
    return false;
}

struct RelayFixture {
    sRelaySettings settings = testSettings();
    std::shared_ptr<sBroker> broker = createMemoryBroker(settings.channelCapacity);

    // Nothing of the transfer is left in the broker
    auto isGone(const std::string& transferId) const -> bool {
        return !broker->metadataStore->exists(transferId)
            && !hasChannelFor(broker, transferId)
            && !broker->readinessChannel->isOpen(transferId);
    }
};

#endif //TRANSIT_RELAY_RELAYFIXTURE_H
