//
// A single connection to the relay database
//

#ifndef TRANSIT_RELAY_MYSQLCONNECTOR_H
#define TRANSIT_RELAY_MYSQLCONNECTOR_H

#include "../Settings.h"
#include <chrono>
#include <sqlpp11/exception.h>
#include <sqlpp11/mysql/connection.h>
#include <sqlpp11/mysql/connection_config.h>
#include <sqlpp11/sqlpp11.h>
#include <string>

namespace mysql = sqlpp::mysql;

class MySqlConnector {
public:
    MySqlConnector() {
        auto config = std::make_shared<mysql::connection_config>();
        config->user = DATABASE_USER;
        config->database = DATABASE_SCHEMA;
        config->password = DATABASE_PASSWORD;
        config->host = DATABASE_HOST;
        config->port = DATABASE_PORT;
#ifdef NDEBUG
        config->debug = false;
#else
        config->debug = true;
#endif
        database = std::make_shared<mysql::connection>(config);
    }

    virtual ~MySqlConnector() = default;
    MySqlConnector(MySqlConnector const&) = delete;
    auto operator =(MySqlConnector const&) -> MySqlConnector& = delete;
    MySqlConnector(MySqlConnector&&) = delete;
    auto operator=(MySqlConnector&&) -> MySqlConnector& = delete;

    auto operator->() const -> std::shared_ptr<mysql::connection>
    { return database; }

    [[nodiscard]] auto getDb() const -> std::shared_ptr<mysql::connection>
    { return database; }

private:
    std::shared_ptr<mysql::connection> database;
};

// Primary key collisions are how the MySQL backend implements create-if-absent
inline auto isDuplicateKeyError(const sqlpp::exception& exception) -> bool {
    return std::string(exception.what()).find("Duplicate entry") != std::string::npos;
}

// Time stamps are stored as milliseconds since the epoch
inline auto epochMilliseconds(std::chrono::system_clock::time_point time = std::chrono::system_clock::now()) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

#endif //TRANSIT_RELAY_MYSQLCONNECTOR_H
