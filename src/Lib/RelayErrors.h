//
// Exceptions raised by the relay. Every one of them carries the human readable reason that is reported to the
// client as "Error: <reason>".
//

#ifndef TRANSIT_RELAY_RELAYERRORS_H
#define TRANSIT_RELAY_RELAYERRORS_H

#include <stdexcept>
#include <string>

class eRelayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] auto clientMessage() const -> std::string {
        return std::string("Error: ") + what();
    }
};

// Bad or missing metadata, or a malformed transfer id. Raised before any state is created.
class eValidationError : public eRelayError {
public:
    using eRelayError::eRelayError;
};

// The transfer id already has a bound sender or receiver. Nothing is mutated.
class eConflictError : public eRelayError {
public:
    eConflictError() : eRelayError("Transfer ID is already used.") {}
};

// The receiver asked for a transfer that doesn't exist or has expired
class eNotFoundError : public eRelayError {
public:
    eNotFoundError() : eRelayError("File not found.") {}
};

// No receiver within the waiting window, or no progress within the idle timeout
class eTimeoutError : public eRelayError {
public:
    using eRelayError::eRelayError;
};

// One side's connection dropped or failed, or the other side interrupted the transfer
class eTransportError : public eRelayError {
public:
    using eRelayError::eRelayError;
};

#endif //TRANSIT_RELAY_RELAYERRORS_H
