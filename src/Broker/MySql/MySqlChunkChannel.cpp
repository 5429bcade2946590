#include "MySqlChunkChannel.h"
#include "../../DB/MySqlConnector.h"
#include "relay_schema.h"
#include <stdexcept>
#include <thread>

using namespace sqlpp;

MySqlChunkChannel::MySqlChunkChannel(uint64_t capacity, std::chrono::milliseconds pollInterval) :
        maxBufferedBytes(capacity), pollInterval(pollInterval) {
    if (maxBufferedBytes == 0) {
        throw std::invalid_argument("Chunk channel capacity must be greater than zero");
    }
}

void MySqlChunkChannel::open(const std::string& channelKey) {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;
    schema::RelayChunk _chunkTable;

    // Discard anything left over under the same key
    _database->run(remove_from(_chunkTable).where(_chunkTable.channelKey == channelKey));
    _database->run(remove_from(_channelTable).where(_channelTable.channelKey == channelKey));

    _database->run(
            insert_into(_channelTable)
                    .set(
                            _channelTable.channelKey = channelKey,
                            _channelTable.bufferedBytes = 0,
                            _channelTable.interrupted = 0,
                            _channelTable.finished = 0,
                            _channelTable.drained = 0
                    )
    );
}

auto MySqlChunkChannel::push(const std::string& channelKey, const StreamItem& item, std::chrono::milliseconds timeout) -> ePushResult {
    if (std::holds_alternative<sInterrupt>(item)) {
        interrupt(channelKey);
        return ePushResult::ok;
    }

    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;
    schema::RelayChunk _chunkTable;

    if (std::holds_alternative<sDone>(item)) {
        auto updated = _database->run(
                update(_channelTable)
                        .set(_channelTable.finished = 1)
                        .where(
                                _channelTable.channelKey == channelKey
                                and _channelTable.interrupted == 0
                                and _channelTable.finished == 0
                        )
        );

        if (updated != 1) {
            auto results = _database->operator()(
                    select(_channelTable.interrupted)
                            .from(_channelTable)
                            .where(_channelTable.channelKey == channelKey)
            );

            if (results.empty() || results.front().interrupted != 0) {
                return ePushResult::interrupted;
            }
            return ePushResult::closed;
        }

        _database->run(
                insert_into(_chunkTable)
                        .set(
                                _chunkTable.channelKey = channelKey,
                                _chunkTable.kind = KIND_DONE,
                                _chunkTable.data = std::vector<uint8_t>()
                        )
        );

        return ePushResult::ok;
    }

    const auto& data = std::get<sChunk>(item).data;
    auto size = static_cast<int64_t>(streamItemSize(item));
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        // Reserve the capacity first. A chunk larger than the whole capacity is let through once the channel is
        // empty.
        auto reserved = _database->run(
                update(_channelTable)
                        .set(_channelTable.bufferedBytes = _channelTable.bufferedBytes + size)
                        .where(
                                _channelTable.channelKey == channelKey
                                and _channelTable.interrupted == 0
                                and _channelTable.finished == 0
                                and (
                                        _channelTable.bufferedBytes + size <= static_cast<int64_t>(maxBufferedBytes)
                                        or _channelTable.bufferedBytes == 0
                                )
                        )
        );

        if (reserved == 1) {
            break;
        }

        auto results = _database->operator()(
                select(_channelTable.interrupted, _channelTable.finished)
                        .from(_channelTable)
                        .where(_channelTable.channelKey == channelKey)
        );

        if (results.empty() || results.front().interrupted != 0) {
            return ePushResult::interrupted;
        }

        if (results.front().finished != 0) {
            return ePushResult::closed;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return ePushResult::timedOut;
        }

        std::this_thread::sleep_for(pollInterval);
    }

    _database->run(
            insert_into(_chunkTable)
                    .set(
                            _chunkTable.channelKey = channelKey,
                            _chunkTable.kind = KIND_CHUNK,
                            _chunkTable.data = data ? *data : std::vector<uint8_t>()
                    )
    );

    return ePushResult::ok;
}

auto MySqlChunkChannel::pop(const std::string& channelKey, std::chrono::milliseconds timeout) -> std::optional<StreamItem> {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;
    schema::RelayChunk _chunkTable;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto channel = _database->operator()(
                select(_channelTable.interrupted)
                        .from(_channelTable)
                        .where(_channelTable.channelKey == channelKey)
        );

        // An interrupt overrides anything that is still queued
        if (channel.empty() || channel.front().interrupted != 0) {
            return sInterrupt{};
        }

        auto chunks = _database->operator()(
                select(_chunkTable.seq, _chunkTable.kind, _chunkTable.data)
                        .from(_chunkTable)
                        .where(_chunkTable.channelKey == channelKey)
                        .order_by(_chunkTable.seq.asc())
                        .limit(1U)
        );

        if (!chunks.empty()) {
            const auto& row = chunks.front();
            int64_t seq = row.seq;

            if (row.kind == KIND_DONE) {
                _database->run(remove_from(_chunkTable).where(_chunkTable.seq == seq));
                _database->run(
                        update(_channelTable)
                                .set(_channelTable.drained = 1)
                                .where(_channelTable.channelKey == channelKey)
                );
                return sDone{};
            }

            auto data = std::make_shared<std::vector<uint8_t>>(row.data.value());
            auto size = static_cast<int64_t>(data->size());

            _database->run(remove_from(_chunkTable).where(_chunkTable.seq == seq));
            _database->run(
                    update(_channelTable)
                            .set(_channelTable.bufferedBytes = _channelTable.bufferedBytes - size)
                            .where(_channelTable.channelKey == channelKey)
            );

            return sChunk{data};
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }

        std::this_thread::sleep_for(pollInterval);
    }
}

void MySqlChunkChannel::interrupt(const std::string& channelKey) {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;

    _database->run(
            update(_channelTable)
                    .set(_channelTable.interrupted = 1)
                    .where(_channelTable.channelKey == channelKey)
    );
}

auto MySqlChunkChannel::awaitDrained(const std::string& channelKey, std::chrono::milliseconds timeout) -> eDrainResult {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto results = _database->operator()(
                select(_channelTable.interrupted, _channelTable.drained)
                        .from(_channelTable)
                        .where(_channelTable.channelKey == channelKey)
        );

        if (results.empty()) {
            return eDrainResult::interrupted;
        }

        if (results.front().drained != 0) {
            return eDrainResult::drained;
        }

        if (results.front().interrupted != 0) {
            return eDrainResult::interrupted;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return eDrainResult::timedOut;
        }

        std::this_thread::sleep_for(pollInterval);
    }
}

auto MySqlChunkChannel::bufferedBytes(const std::string& channelKey) -> uint64_t {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;

    auto results = _database->operator()(
            select(_channelTable.bufferedBytes)
                    .from(_channelTable)
                    .where(_channelTable.channelKey == channelKey)
    );

    if (results.empty()) {
        return 0;
    }

    return static_cast<uint64_t>(results.front().bufferedBytes);
}

auto MySqlChunkChannel::exists(const std::string& channelKey) -> bool {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;

    auto results = _database->operator()(
            select(_channelTable.channelKey)
                    .from(_channelTable)
                    .where(_channelTable.channelKey == channelKey)
    );

    return !results.empty();
}

void MySqlChunkChannel::remove(const std::string& channelKey) {
    auto _database = MySqlConnector();
    schema::RelayChannel _channelTable;
    schema::RelayChunk _chunkTable;

    // The channel row goes first, so a concurrent pop reads the channel as interrupted rather than an empty queue
    _database->run(remove_from(_channelTable).where(_channelTable.channelKey == channelKey));
    _database->run(remove_from(_chunkTable).where(_chunkTable.channelKey == channelKey));
}
