//
// Interface for the one-shot "receiver is ready" signal of a transfer
//

#ifndef TRANSIT_RELAY_I_READINESS_CHANNEL_H
#define TRANSIT_RELAY_I_READINESS_CHANNEL_H

#include <chrono>
#include <string>

class IReadinessChannel {
public:
    virtual ~IReadinessChannel() = default;

    // Creates the signal if it doesn't already exist. The signal is the claim on a transfer id, so a false result
    // means the id is in use. Every other call names the generation that opened the signal, and does nothing to a
    // signal opened by a different generation.
    virtual auto open(const std::string& transferId, const std::string& generation, std::chrono::milliseconds lifetime) -> bool = 0;

    // Returns true once the signal was raised, false on timeout or if the signal was closed
    virtual auto awaitReady(const std::string& transferId, const std::string& generation, std::chrono::milliseconds timeout) -> bool = 0;

    // Raises the signal. Raising a missing, closed or already raised signal does nothing and returns false.
    virtual auto signalReady(const std::string& transferId, const std::string& generation) -> bool = 0;

    // True while any generation holds the id
    virtual auto isOpen(const std::string& transferId) -> bool = 0;

    virtual void close(const std::string& transferId, const std::string& generation) = 0;
};

#endif //TRANSIT_RELAY_I_READINESS_CHANNEL_H
