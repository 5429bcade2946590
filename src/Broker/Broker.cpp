#include "Broker.h"
#include "Memory/MemoryChunkChannel.h"
#include "Memory/MemoryMetadataStore.h"
#include "Memory/MemoryReadinessChannel.h"
#include "MySql/MySqlChunkChannel.h"
#include "MySql/MySqlMetadataStore.h"
#include "MySql/MySqlReadinessChannel.h"
#include <iostream>
#include <stdexcept>

auto createMemoryBroker(uint64_t channelCapacity) -> std::shared_ptr<sBroker> {
    return std::make_shared<sBroker>(sBroker{
            .metadataStore = std::make_shared<MemoryMetadataStore>(),
            .readinessChannel = std::make_shared<MemoryReadinessChannel>(),
            .chunkChannel = std::make_shared<MemoryChunkChannel>(channelCapacity)
    });
}

auto createMySqlBroker(uint64_t channelCapacity, std::chrono::milliseconds pollInterval) -> std::shared_ptr<sBroker> {
    return std::make_shared<sBroker>(sBroker{
            .metadataStore = std::make_shared<MySqlMetadataStore>(),
            .readinessChannel = std::make_shared<MySqlReadinessChannel>(pollInterval),
            .chunkChannel = std::make_shared<MySqlChunkChannel>(channelCapacity, pollInterval)
    });
}

auto createBroker(const sRelaySettings& settings) -> std::shared_ptr<sBroker> {
    if (settings.chunkSize == 0) {
        throw std::invalid_argument("Chunk size must be greater than zero");
    }

    if (settings.channelCapacity < settings.chunkSize) {
        throw std::invalid_argument(
                "Channel capacity (" + std::to_string(settings.channelCapacity)
                + ") must be at least one chunk (" + std::to_string(settings.chunkSize) + ")"
        );
    }

    if (settings.broker == RELAY_BROKER_MEMORY) {
        std::cout << "Broker: Using the in-memory backend" << std::endl;
        return createMemoryBroker(settings.channelCapacity);
    }

    if (settings.broker == RELAY_BROKER_MYSQL) {
        std::cout << "Broker: Using the MySQL backend" << std::endl;
        return createMySqlBroker(settings.channelCapacity, settings.brokerPollInterval);
    }

    throw std::invalid_argument("Unknown broker backend " + settings.broker);
}
