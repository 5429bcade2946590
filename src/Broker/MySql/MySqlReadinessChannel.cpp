#include "MySqlReadinessChannel.h"
#include "../../DB/MySqlConnector.h"
#include "relay_schema.h"
#include <thread>

using namespace sqlpp;

auto MySqlReadinessChannel::open(const std::string& transferId, const std::string& generation, std::chrono::milliseconds lifetime) -> bool {
    auto _database = MySqlConnector();
    schema::RelayReady _readyTable;

    // Take over a signal whose owner never cleaned up
    _database->run(
            remove_from(_readyTable)
                    .where(
                            _readyTable.transferId == transferId
                            and _readyTable.expiresAt <= epochMilliseconds()
                    )
    );

    try {
        _database->run(
                insert_into(_readyTable)
                        .set(
                                _readyTable.transferId = transferId,
                                _readyTable.generation = generation,
                                _readyTable.signaled = 0,
                                _readyTable.expiresAt = epochMilliseconds(std::chrono::system_clock::now() + lifetime)
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

auto MySqlReadinessChannel::awaitReady(const std::string& transferId, const std::string& generation, std::chrono::milliseconds timeout) -> bool {
    auto _database = MySqlConnector();
    schema::RelayReady _readyTable;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto results = _database->operator()(
                select(_readyTable.signaled)
                        .from(_readyTable)
                        .where(
                                _readyTable.transferId == transferId
                                and _readyTable.generation == generation
                        )
        );

        // A missing row means the signal was closed, or now belongs to another generation
        if (results.empty()) {
            return false;
        }

        if (results.front().signaled != 0) {
            return true;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }

        std::this_thread::sleep_for(pollInterval);
    }
}

auto MySqlReadinessChannel::signalReady(const std::string& transferId, const std::string& generation) -> bool {
    auto _database = MySqlConnector();
    schema::RelayReady _readyTable;

    auto updated = _database->run(
            update(_readyTable)
                    .set(_readyTable.signaled = 1)
                    .where(
                            _readyTable.transferId == transferId
                            and _readyTable.generation == generation
                            and _readyTable.signaled == 0
                    )
    );

    return updated == 1;
}

auto MySqlReadinessChannel::isOpen(const std::string& transferId) -> bool {
    auto _database = MySqlConnector();
    schema::RelayReady _readyTable;

    auto results = _database->operator()(
            select(_readyTable.transferId)
                    .from(_readyTable)
                    .where(_readyTable.transferId == transferId)
    );

    return !results.empty();
}

void MySqlReadinessChannel::close(const std::string& transferId, const std::string& generation) {
    auto _database = MySqlConnector();
    schema::RelayReady _readyTable;

    _database->run(
            remove_from(_readyTable)
                    .where(
                            _readyTable.transferId == transferId
                            and _readyTable.generation == generation
                    )
    );
}
