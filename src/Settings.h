//
// Relay settings, read from the environment
//

#ifndef TRANSIT_RELAY_SETTINGS_H
#define TRANSIT_RELAY_SETTINGS_H

#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

#define DATABASE_USER               GET_ENV("DATABASE_USER", "relay")
#define DATABASE_PASSWORD           GET_ENV("DATABASE_PASSWORD", "relay")
#define DATABASE_SCHEMA             GET_ENV("DATABASE_SCHEMA", "relay")
#define DATABASE_HOST               GET_ENV("DATABASE_HOST", "localhost")
#define DATABASE_PORT               std::stoi(GET_ENV("DATABASE_PORT", "3306"))

#define RELAY_BROKER                GET_ENV("RELAY_BROKER", "memory")
#define RELAY_BROKER_POLL_MS        std::stoull(GET_ENV("RELAY_BROKER_POLL_MS", "50"))

#define RELAY_CHUNK_SIZE            std::stoull(GET_ENV("RELAY_CHUNK_SIZE", std::to_string(1024*64)))
#define RELAY_CHANNEL_CAPACITY      std::stoull(GET_ENV("RELAY_CHANNEL_CAPACITY", std::to_string(1024*1024)))
#define RELAY_HTTP_UPLOAD_MAX_SIZE  std::stoull(GET_ENV("RELAY_HTTP_UPLOAD_MAX_SIZE", std::to_string(1024*1024*100)))

#define RELAY_RECEIVER_TIMEOUT_SECONDS  std::stoull(GET_ENV("RELAY_RECEIVER_TIMEOUT_SECONDS", std::to_string(60*5)))
#define RELAY_RECORD_TTL_SECONDS        std::stoull(GET_ENV("RELAY_RECORD_TTL_SECONDS", std::to_string(60*60)))

#ifndef BUILD_TESTS
    #define RELAY_IDLE_TIMEOUT_SECONDS      std::stoull(GET_ENV("RELAY_IDLE_TIMEOUT_SECONDS", "30"))
    #define RELAY_PRUNE_INTERVAL_SECONDS    std::stoull(GET_ENV("RELAY_PRUNE_INTERVAL_SECONDS", "60"))
#else
    #define RELAY_IDLE_TIMEOUT_SECONDS      2ULL
    #define RELAY_PRUNE_INTERVAL_SECONDS    1ULL
#endif

constexpr const char* RELAY_BROKER_MEMORY = "memory";
constexpr const char* RELAY_BROKER_MYSQL = "mysql";

constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";
constexpr const char* GO_FOR_FILE_CHUNKS = "Go for file chunks";

const uint64_t MAX_FILE_NAME_LENGTH = 255;
const uint64_t MAX_TRANSFER_ID_LENGTH = 64;

const uint16_t HTTP_PORT = 8000;
const uint32_t HTTP_WORKER_POOL_SIZE = 64;
// Room for the request line and headers, which share the request buffer with the body
const uint64_t HTTP_MAX_HEADER_SIZE = 64 * 1024;

const uint16_t WEBSOCKET_PORT = 8001;
const uint32_t WEBSOCKET_WORKER_POOL_SIZE = 64;

// The values every component of the relay is configured with. Built from the environment in production, built
// directly by the tests so that timeouts can be shortened.
struct sRelaySettings {
    uint64_t chunkSize = 0;
    uint64_t channelCapacity = 0;
    uint64_t httpUploadMaxSize = 0;

    std::chrono::milliseconds receiverTimeout{};
    std::chrono::milliseconds idleTimeout{};
    std::chrono::milliseconds recordTtl{};
    std::chrono::milliseconds pruneInterval{};
    std::chrono::milliseconds brokerPollInterval{};

    std::string broker;

    uint16_t httpPort = HTTP_PORT;
    uint16_t websocketPort = WEBSOCKET_PORT;

    static auto fromEnvironment() -> sRelaySettings {
        return {
                .chunkSize = RELAY_CHUNK_SIZE,
                .channelCapacity = RELAY_CHANNEL_CAPACITY,
                .httpUploadMaxSize = RELAY_HTTP_UPLOAD_MAX_SIZE,
                .receiverTimeout = std::chrono::seconds(RELAY_RECEIVER_TIMEOUT_SECONDS),
                .idleTimeout = std::chrono::seconds(RELAY_IDLE_TIMEOUT_SECONDS),
                .recordTtl = std::chrono::seconds(RELAY_RECORD_TTL_SECONDS),
                .pruneInterval = std::chrono::seconds(RELAY_PRUNE_INTERVAL_SECONDS),
                .brokerPollInterval = std::chrono::milliseconds(RELAY_BROKER_POLL_MS),
                .broker = RELAY_BROKER
        };
    }
};

#endif //TRANSIT_RELAY_SETTINGS_H
