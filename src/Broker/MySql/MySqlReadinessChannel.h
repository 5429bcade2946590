//
// Readiness signal backed by the relay_ready table. Waiting polls the row.
//

#ifndef TRANSIT_RELAY_MYSQLREADINESSCHANNEL_H
#define TRANSIT_RELAY_MYSQLREADINESSCHANNEL_H

#include "../../Interfaces/IReadinessChannel.h"

class MySqlReadinessChannel : public IReadinessChannel {
public:
    explicit MySqlReadinessChannel(std::chrono::milliseconds pollInterval) : pollInterval(pollInterval) {}

    auto open(const std::string& transferId, const std::string& generation, std::chrono::milliseconds lifetime) -> bool override;
    auto awaitReady(const std::string& transferId, const std::string& generation, std::chrono::milliseconds timeout) -> bool override;
    auto signalReady(const std::string& transferId, const std::string& generation) -> bool override;
    auto isOpen(const std::string& transferId) -> bool override;
    void close(const std::string& transferId, const std::string& generation) override;

private:
    const std::chrono::milliseconds pollInterval;
};

#endif //TRANSIT_RELAY_MYSQLREADINESSCHANNEL_H
