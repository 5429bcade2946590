//
// The bundle of capabilities every transfer coordinates through
//

#ifndef TRANSIT_RELAY_BROKER_H
#define TRANSIT_RELAY_BROKER_H

#include "../Interfaces/IChunkChannel.h"
#include "../Interfaces/IMetadataStore.h"
#include "../Interfaces/IReadinessChannel.h"
#include "../Settings.h"
#include <memory>

struct sBroker {
    std::shared_ptr<IMetadataStore> metadataStore;
    std::shared_ptr<IReadinessChannel> readinessChannel;
    std::shared_ptr<IChunkChannel> chunkChannel;
};

// Builds the backend named by settings.broker. Throws std::invalid_argument for an unknown backend, or if the
// channel capacity can't hold a single chunk.
auto createBroker(const sRelaySettings& settings) -> std::shared_ptr<sBroker>;

auto createMemoryBroker(uint64_t channelCapacity) -> std::shared_ptr<sBroker>;
auto createMySqlBroker(uint64_t channelCapacity, std::chrono::milliseconds pollInterval) -> std::shared_ptr<sBroker>;

#endif //TRANSIT_RELAY_BROKER_H
