#pragma once

#include "config/EngineConfig.hpp"
#include "core/Error.hpp"
#include "core/Value.hpp"
#include "protocol/Messages.hpp"
#include "session/Session.hpp"
#include "storage/SessionStore.hpp"

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

// Outbound half of one client connection; transport and framing live behind it.
class MessageSink {
public:
    virtual ~MessageSink() = default;

    virtual void send(Protocol::ServerMessage const& message) = 0;
};

struct CommandContext {
    std::string   sessionId;
    std::uint64_t openTurn = 0;
    Value         state;
};

struct CommandOutcome {
    std::vector<Delta> deltas;
    // Close the open turn once the deltas are submitted.
    bool               endTurn = false;
};

// Game rules. Turns a client command into deltas for the open turn.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    virtual auto handle(CommandContext const& context, Value const& command) -> Expected<CommandOutcome> = 0;
};

/**
 * Routes client messages to sessions and fans turn results out to connections.
 *
 * Each connection is bound to at most one session (NEW_SESSION / LOAD_SESSION) and
 * carries an event-type filter set by SUBSCRIBE; an empty filter receives every
 * event. Committed turns are broadcast as one EVENTS message per connection holding
 * the STATE_DELTA events, TURN_END and the TURN_START of the next turn. Rejected
 * deltas and rolled-back turns are reported as ERROR messages.
 *
 * handle() may be called from any number of connection threads. The coordinator
 * never holds its own lock while waiting on a session.
 */
class SessionCoordinator final : private SessionObserver {
public:
    using ConnectionId = std::uint64_t;

    explicit SessionCoordinator(EngineConfig config,
                                std::shared_ptr<CommandHandler> handler = {},
                                std::shared_ptr<SessionStore> store = {});
    ~SessionCoordinator() override;

    SessionCoordinator(SessionCoordinator const&)            = delete;
    SessionCoordinator& operator=(SessionCoordinator const&) = delete;

    [[nodiscard]] auto connect(std::shared_ptr<MessageSink> sink) -> ConnectionId;
    void disconnect(ConnectionId connection);

    void handle(ConnectionId connection, Protocol::ClientMessage const& message);
    // Decodes a wire document first; undecodable input is answered with ERROR.
    void handleText(ConnectionId connection, std::string_view payload);

    [[nodiscard]] auto createSession(Protocol::NewSessionRequest const& request) -> Expected<std::string>;
    [[nodiscard]] auto loadSession(std::string const& sessionId) -> Expected<std::shared_ptr<Session>>;
    [[nodiscard]] auto findSession(std::string const& sessionId) const -> std::shared_ptr<Session>;

    [[nodiscard]] auto submitDelta(std::string const& sessionId, Delta delta) -> Expected<TurnSequencer::Submitted>;
    [[nodiscard]] auto closeTurn(std::string const& sessionId) -> Expected<CommitResult>;
    [[nodiscard]] auto commitBatch(std::string const& sessionId, TurnDeltas batch) -> Expected<CommitResult>;

    // Shuts the session down and archives it when a store is configured.
    [[nodiscard]] auto closeSession(std::string const& sessionId) -> Expected<void>;
    // Closes every session idle for at least SessionOptions::idleEviction.
    auto evictIdle(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
            -> std::vector<std::string>;

    [[nodiscard]] auto listSessions() -> Expected<std::vector<SessionSummary>>;
    [[nodiscard]] auto sessionCount() const -> std::size_t;
    [[nodiscard]] auto config() const -> EngineConfig const& { return config_; }

private:
    struct Connection {
        std::shared_ptr<MessageSink> sink;
        std::string                  sessionId;
        std::set<std::string>        eventTypes;
    };

    void onTurnCommitted(std::string const& sessionId, CommitResult const& result) override;
    void onTurnRolledBack(std::string const& sessionId, std::uint64_t turn, Error const& error) override;

    void sendTo(ConnectionId connection, Protocol::ServerMessage const& message);
    void sendError(ConnectionId connection, Error const& error, std::optional<Value> details = std::nullopt);
    void sendToSession(std::string const& sessionId, Protocol::ServerMessage const& message);
    void broadcastEvents(std::string const& sessionId, std::vector<Protocol::GameEvent> const& events);

    auto bind(ConnectionId connection, std::string const& sessionId) -> void;
    auto boundSession(ConnectionId connection) -> Expected<std::shared_ptr<Session>>;
    auto registerSession(std::unique_ptr<Session> session) -> std::shared_ptr<Session>;

    void handleCommand(ConnectionId connection, Protocol::CommandRequest const& request);

    EngineConfig                                                  config_;
    std::shared_ptr<CommandHandler>                               handler_;
    std::shared_ptr<SessionStore>                                 store_;
    mutable std::mutex                                            mutex_;
    phmap::flat_hash_map<std::string, std::shared_ptr<Session>>   sessions_;
    std::map<ConnectionId, Connection>                            connections_;
    ConnectionId                                                  nextConnection_ = 1;
};

// State as sent to clients: the tree with its sessionId and turn attached.
[[nodiscard]] auto presentState(std::string const& sessionId, std::uint64_t turn, Value const& state) -> Value;
[[nodiscard]] auto initialSessionState(Protocol::NewSessionRequest const& request) -> Value;

} // namespace TS
