//
// The state machine of a single transfer. The sender side creates the transfer and owns its lifecycle, the receiver
// side attaches to it. The two sides only share the broker.
//

#ifndef TRANSIT_RELAY_TRANSFERSESSION_H
#define TRANSIT_RELAY_TRANSFERSESSION_H

#include "../Broker/Broker.h"
#include "../Settings.h"
#include "FileMetadata.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class eSessionState {
    created,
    awaitingReceiver,
    streaming,
    completed,
    failed,
    expired
};

enum class eSessionRole {
    sender,
    receiver
};

auto sessionStateName(eSessionState state) -> std::string;

class TransferSession {
public:
    // Claims the transfer id and publishes the metadata. Throws eValidationError for a bad id, eConflictError if
    // the id is already in use.
    static auto create(
            std::shared_ptr<sBroker> broker,
            const sRelaySettings& settings,
            const std::string& transferId,
            const sFileMetadata& metadata
    ) -> std::shared_ptr<TransferSession>;

    // Binds the receiver to an existing transfer. Throws eValidationError for a bad id, eNotFoundError if the
    // transfer doesn't exist and eConflictError if a receiver is already bound.
    static auto attach(
            std::shared_ptr<sBroker> broker,
            const sRelaySettings& settings,
            const std::string& transferId
    ) -> std::shared_ptr<TransferSession>;

    TransferSession(
            std::shared_ptr<sBroker> broker,
            sRelaySettings settings,
            sTransferRecord record,
            eSessionRole role
    );
    ~TransferSession();

    TransferSession(TransferSession const&) = delete;
    auto operator=(TransferSession const&) -> TransferSession& = delete;
    TransferSession(TransferSession&&) = delete;
    auto operator=(TransferSession&&) -> TransferSession& = delete;

    // Sender side

    // Blocks until the receiver is ready. Throws eTimeoutError if no receiver arrived in time, or eTransportError
    // if the session failed while waiting.
    void awaitReceiver();

    // Blocks until the session leaves the waiting states. Returns true if data may be pushed.
    auto awaitStreaming() -> bool;

    // Slices the data into chunks and pushes them, blocking while the channel is full
    void pushChunk(const std::vector<uint8_t>& data);

    // Ends the stream and waits until the receiver has consumed it, then cleans up
    void finish();

    // Blocks until the stream has ended. A stream interrupted by the receiver fails the session, which cleans it up
    // even if the sender has stopped sending. Throws if the session failed.
    void awaitCompletion();

    // Receiver side

    void signalReady();

    // Throws eNotFoundError, and fails the session, if the sender already gave up on the transfer
    void checkSenderPresent();

    // Returns the next chunk, or nullptr once the stream completed. Throws if the stream was interrupted or stalled.
    auto nextChunk() -> std::shared_ptr<std::vector<uint8_t>>;

    // Either side

    // Moves the session to failed, and interrupts the stream so that the other side sees it
    void fail(const std::string& reason);

    // Removes every trace of the transfer from the broker. Safe to call more than once.
    void cleanup();

    [[nodiscard]] auto getState() const -> eSessionState;
    [[nodiscard]] auto isTerminal() const -> bool;
    [[nodiscard]] auto getFailureReason() const -> std::string;

    [[nodiscard]] auto getTransferId() const -> const std::string& {
        return transferId;
    }

    [[nodiscard]] auto getGeneration() const -> const std::string& {
        return generation;
    }

    [[nodiscard]] auto getChannelKey() const -> const std::string& {
        return channelKey;
    }

    [[nodiscard]] auto getMetadata() const -> const sFileMetadata& {
        return metadata;
    }

    [[nodiscard]] auto getRole() const -> eSessionRole {
        return role;
    }

    [[nodiscard]] auto getBytesTransferred() const -> uint64_t {
        return bytesTransferred;
    }

private:
    // Moves to the terminal state unless the session already finished. Returns false if it had.
    auto terminate(eSessionState terminalState, const std::string& reason, bool timedOut = false) -> bool;
    void failWith(const std::string& reason, bool timedOut);

    // Builds the exception for a session that already failed
    [[noreturn]] void throwFailure() const;

    void log(const std::string& message) const;

    std::shared_ptr<sBroker> broker;
    const sRelaySettings settings;
    const std::string transferId;
    const std::string generation;
    const std::string channelKey;
    const sFileMetadata metadata;
    const eSessionRole role;

    mutable std::mutex stateMutex;
    std::condition_variable stateCV;
    eSessionState state = eSessionState::created;
    std::string failureReason;
    bool failureWasTimeout = false;

    std::atomic<uint64_t> bytesTransferred = 0;
    std::atomic<bool> cleanedUp = false;
};

#endif //TRANSIT_RELAY_TRANSFERSESSION_H
