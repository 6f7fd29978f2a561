#include "session/SessionCoordinator.hpp"

#include "core/Identifiers.hpp"
#include "log/TaggedLogger.hpp"

#include <utility>

namespace TS {

using namespace Protocol;

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto noSessionBound() -> Error {
    return Error{Error::Code::SessionNotFound, "connection has no session; send NEW_SESSION or LOAD_SESSION"};
}

auto details(std::initializer_list<std::pair<std::string const, Value>> members) -> Value {
    return Value::object(Value::Object(members));
}

} // namespace

auto presentState(std::string const& sessionId, std::uint64_t turn, Value const& state) -> Value {
    if (!state.isObject()) {
        return state;
    }
    return state.withMember("sessionId", Value{sessionId}).withMember("turn", Value{turn});
}

auto initialSessionState(NewSessionRequest const& request) -> Value {
    Value player = request.characterTemplate.isObject() ? request.characterTemplate : Value::object();
    if (auto const* name = player.find("name"); !name || !name->isString()) {
        player = player.withMember("name", Value{request.playerName});
    }
    return Value::object({
            {std::string(StateRoots::World), Value::object({{"theme", Value{request.themeName}}})},
            {std::string(StateRoots::Player), std::move(player)},
            {std::string(StateRoots::Npcs), Value::object()},
            {std::string(StateRoots::Scene), Value::object()},
    });
}

SessionCoordinator::SessionCoordinator(EngineConfig config,
                                       std::shared_ptr<CommandHandler> handler,
                                       std::shared_ptr<SessionStore> store)
    : config_(std::move(config)), handler_(std::move(handler)), store_(std::move(store)) {
    if (!store_ && config_.storeRoot) {
        store_ = std::make_shared<FileSessionStore>(*config_.storeRoot);
    }
}

SessionCoordinator::~SessionCoordinator() {
    decltype(sessions_) sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    // Workers call back into this object; stop them before members go away.
    for (auto& [id, session] : sessions) {
        session->shutdown();
    }
}

auto SessionCoordinator::connect(std::shared_ptr<MessageSink> sink) -> ConnectionId {
    std::lock_guard<std::mutex> lock(mutex_);
    auto const                  id = nextConnection_++;
    connections_.emplace(id, Connection{std::move(sink), {}, {}});
    return id;
}

void SessionCoordinator::disconnect(ConnectionId connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(connection);
}

void SessionCoordinator::handleText(ConnectionId connection, std::string_view payload) {
    auto message = deserializeClientMessage(payload);
    if (!message) {
        sendError(connection, message.error());
        return;
    }
    handle(connection, *message);
}

void SessionCoordinator::handle(ConnectionId connection, ClientMessage const& message) {
    ts_log("Connection " + std::to_string(connection) + " sent " + std::string(messageType(message)), "Coordinator");
    std::visit(
            Overloaded{
                    [&](CommandRequest const& request) { handleCommand(connection, request); },
                    [&](GetStateRequest const&) {
                        auto session = boundSession(connection);
                        if (!session) {
                            sendError(connection, session.error());
                            return;
                        }
                        auto view = (*session)->history();
                        sendTo(connection, StateMessage{presentState((*session)->id(), view->headTurn, view->headState)});
                    },
                    [&](GetStateAtTurnRequest const& request) {
                        auto session = boundSession(connection);
                        if (!session) {
                            sendError(connection, session.error());
                            return;
                        }
                        auto state = (*session)->stateAt(request.turn);
                        if (!state) {
                            sendError(connection, state.error(), details({{"turn", Value{request.turn}}}));
                            return;
                        }
                        sendTo(connection, StateMessage{presentState((*session)->id(), request.turn, *state)});
                    },
                    [&](PingRequest const& request) {
                        sendTo(connection, PongMessage{request.timestamp, toMillis(std::chrono::system_clock::now())});
                    },
                    [&](SubscribeRequest const& request) {
                        std::lock_guard<std::mutex> lock(mutex_);
                        if (auto it = connections_.find(connection); it != connections_.end()) {
                            it->second.eventTypes = std::set<std::string>(request.eventTypes.begin(),
                                                                          request.eventTypes.end());
                        }
                    },
                    [&](ListSessionsRequest const&) {
                        auto sessions = listSessions();
                        if (!sessions) {
                            sendError(connection, sessions.error());
                            return;
                        }
                        sendTo(connection, SessionListMessage{std::move(*sessions)});
                    },
                    [&](LoadSessionRequest const& request) {
                        auto session = loadSession(request.sessionId);
                        if (!session) {
                            sendError(connection, session.error(), details({{"sessionId", Value{request.sessionId}}}));
                            return;
                        }
                        bind(connection, request.sessionId);
                        auto view = (*session)->history();
                        sendTo(connection,
                               SessionLoadedMessage{request.sessionId,
                                                    presentState(request.sessionId, view->headTurn, view->headState)});
                    },
                    [&](NewSessionRequest const& request) {
                        auto id = createSession(request);
                        if (!id) {
                            sendError(connection, id.error());
                            return;
                        }
                        bind(connection, *id);
                        auto session = findSession(*id);
                        auto view    = session->history();
                        sendTo(connection, SessionLoadedMessage{*id, presentState(*id, view->headTurn, view->headState)});
                    },
            },
            message);
}

void SessionCoordinator::handleCommand(ConnectionId connection, CommandRequest const& request) {
    auto const commandId = request.commandId();
    auto       fail      = [&](Error const& error) {
        sendError(connection, error, details({{"commandId", Value{commandId}}}));
        sendTo(connection, AckMessage{commandId, false, describeError(error)});
    };

    auto session = boundSession(connection);
    if (!session) {
        fail(session.error());
        return;
    }
    if (!handler_) {
        fail(Error{Error::Code::NoHandler, "no command handler is installed"});
        return;
    }
    auto view    = (*session)->history();
    auto outcome = handler_->handle(CommandContext{(*session)->id(), view->headTurn + 1, view->headState}, request.command);
    if (!outcome) {
        fail(outcome.error());
        return;
    }

    std::optional<std::string> firstError;
    for (auto& delta : outcome->deltas) {
        auto const deltaId   = delta.id;
        auto       submitted = (*session)->submit(std::move(delta)).get();
        if (!submitted) {
            sendError(connection, submitted.error(), details({{"deltaId", Value{deltaId}}, {"commandId", Value{commandId}}}));
            if (!firstError) {
                firstError = describeError(submitted.error());
            }
        }
    }
    if (outcome->endTurn) {
        auto committed = (*session)->closeTurn().get();
        if (!committed && !firstError) {
            sendError(connection, committed.error(), details({{"commandId", Value{commandId}}}));
            firstError = describeError(committed.error());
        }
    }
    sendTo(connection, AckMessage{commandId, !firstError.has_value(), firstError});
}

auto SessionCoordinator::registerSession(std::unique_ptr<Session> session) -> std::shared_ptr<Session> {
    std::shared_ptr<Session>    shared = std::move(session);
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = sessions_.try_emplace(shared->id(), shared);
    return it->second;
}

auto SessionCoordinator::createSession(NewSessionRequest const& request) -> Expected<std::string> {
    SessionMetadata metadata;
    metadata.id         = generateUuid();
    metadata.name       = request.themeName + " - " + request.playerName;
    metadata.themeName  = request.themeName;
    metadata.playerName = request.playerName;
    metadata.createdAt  = nowTimestamp();
    metadata.updatedAt  = metadata.createdAt;

    auto session = Session::create(std::move(metadata), initialSessionState(request), config_.sequencer, config_.snapshots, this);
    auto id      = session->id();
    registerSession(std::move(session));
    ts_log("Created session " + id, "Coordinator");
    return id;
}

auto SessionCoordinator::loadSession(std::string const& sessionId) -> Expected<std::shared_ptr<Session>> {
    if (auto active = findSession(sessionId)) {
        return active;
    }
    if (!store_) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "no session " + sessionId});
    }
    auto archive = store_->load(sessionId);
    if (!archive) {
        return std::unexpected(archive.error());
    }
    auto session = Session::restore(std::move(*archive), config_.sequencer, config_.snapshots, this);
    if (!session) {
        return std::unexpected(session.error());
    }
    // A concurrent load of the same id may have won; registerSession keeps the first.
    auto registered = registerSession(std::move(*session));
    return registered;
}

auto SessionCoordinator::findSession(std::string const& sessionId) const -> std::shared_ptr<Session> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = sessions_.find(sessionId); it != sessions_.end()) {
        return it->second;
    }
    return nullptr;
}

auto SessionCoordinator::submitDelta(std::string const& sessionId, Delta delta) -> Expected<TurnSequencer::Submitted> {
    auto session = findSession(sessionId);
    if (!session) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "no session " + sessionId});
    }
    return session->submit(std::move(delta)).get();
}

auto SessionCoordinator::closeTurn(std::string const& sessionId) -> Expected<CommitResult> {
    auto session = findSession(sessionId);
    if (!session) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "no session " + sessionId});
    }
    return session->closeTurn().get();
}

auto SessionCoordinator::commitBatch(std::string const& sessionId, TurnDeltas batch) -> Expected<CommitResult> {
    auto session = findSession(sessionId);
    if (!session) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "no session " + sessionId});
    }
    return session->commitBatch(std::move(batch)).get();
}

auto SessionCoordinator::closeSession(std::string const& sessionId) -> Expected<void> {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto                        it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return std::unexpected(Error{Error::Code::SessionNotFound, "no session " + sessionId});
        }
        session = std::move(it->second);
        sessions_.erase(it);
        for (auto& [id, connection] : connections_) {
            if (connection.sessionId == sessionId) {
                connection.sessionId.clear();
            }
        }
    }
    session->shutdown();
    ts_log("Closed session " + sessionId, "Coordinator");
    if (store_) {
        return store_->save(session->archive());
    }
    return {};
}

auto SessionCoordinator::evictIdle(std::chrono::steady_clock::time_point now) -> std::vector<std::string> {
    std::vector<std::string> evicted;
    if (config_.session.idleEviction.count() <= 0) {
        return evicted;
    }
    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& [id, session] : sessions_) {
            if (session->idleFor(now) >= config_.session.idleEviction) {
                idle.push_back(id);
            }
        }
    }
    for (auto const& id : idle) {
        auto closed = closeSession(id);
        if (!closed) {
            ts_log("Evicting " + id + " failed: " + describeError(closed.error()), "Coordinator");
            if (closed.error().code == Error::Code::SessionNotFound) {
                continue;
            }
        }
        evicted.push_back(id);
    }
    return evicted;
}

auto SessionCoordinator::listSessions() -> Expected<std::vector<SessionSummary>> {
    std::vector<SessionSummary>  sessions;
    phmap::flat_hash_set<std::string> seen;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& [id, session] : sessions_) {
            sessions.push_back(summarize(session->metadata()));
            seen.insert(id);
        }
    }
    if (store_) {
        auto archived = store_->list();
        if (!archived) {
            return std::unexpected(archived.error());
        }
        for (auto& summary : *archived) {
            if (!seen.contains(summary.id)) {
                sessions.push_back(std::move(summary));
            }
        }
    }
    return sessions;
}

auto SessionCoordinator::sessionCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

auto SessionCoordinator::bind(ConnectionId connection, std::string const& sessionId) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = connections_.find(connection); it != connections_.end()) {
        it->second.sessionId = sessionId;
    }
}

auto SessionCoordinator::boundSession(ConnectionId connection) -> Expected<std::shared_ptr<Session>> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = connections_.find(connection);
    if (it == connections_.end() || it->second.sessionId.empty()) {
        return std::unexpected(noSessionBound());
    }
    auto session = sessions_.find(it->second.sessionId);
    if (session == sessions_.end()) {
        return std::unexpected(Error{Error::Code::SessionNotFound, "session " + it->second.sessionId + " is closed"});
    }
    return session->second;
}

void SessionCoordinator::sendTo(ConnectionId connection, ServerMessage const& message) {
    std::shared_ptr<MessageSink> sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = connections_.find(connection); it != connections_.end()) {
            sink = it->second.sink;
        }
    }
    if (sink) {
        sink->send(message);
    }
}

void SessionCoordinator::sendError(ConnectionId connection, Error const& error, std::optional<Value> extra) {
    sendTo(connection, makeErrorMessage(error, std::move(extra)));
}

void SessionCoordinator::sendToSession(std::string const& sessionId, ServerMessage const& message) {
    std::vector<std::shared_ptr<MessageSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& [id, connection] : connections_) {
            if (connection.sessionId == sessionId && connection.sink) {
                sinks.push_back(connection.sink);
            }
        }
    }
    for (auto const& sink : sinks) {
        sink->send(message);
    }
}

void SessionCoordinator::broadcastEvents(std::string const& sessionId, std::vector<GameEvent> const& events) {
    std::vector<std::pair<std::shared_ptr<MessageSink>, EventsMessage>> outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const& [id, connection] : connections_) {
            if (connection.sessionId != sessionId || !connection.sink) {
                continue;
            }
            EventsMessage message;
            for (auto const& event : events) {
                if (connection.eventTypes.empty() || connection.eventTypes.contains(event.type)) {
                    message.events.push_back(event);
                }
            }
            if (!message.events.empty()) {
                outgoing.emplace_back(connection.sink, std::move(message));
            }
        }
    }
    for (auto const& [sink, message] : outgoing) {
        sink->send(message);
    }
}

void SessionCoordinator::onTurnCommitted(std::string const& sessionId, CommitResult const& result) {
    for (auto const& rejection : result.rejected) {
        sendToSession(sessionId,
                      makeErrorMessage(rejection.error,
                                       details({{"deltaId", Value{rejection.delta.id}},
                                                {"turn", Value{rejection.delta.turn}}})));
    }
    std::vector<GameEvent> events;
    events.reserve(result.batch.deltas.size() + 2);
    for (auto const& delta : result.batch.deltas) {
        events.push_back(makeStateDeltaEvent(sessionId, delta));
    }
    events.push_back(makeTurnEndEvent(sessionId, result.batch, result.rejected.size()));
    events.push_back(makeTurnStartEvent(sessionId, result.batch.turn + 1, result.state));
    broadcastEvents(sessionId, events);
}

void SessionCoordinator::onTurnRolledBack(std::string const& sessionId, std::uint64_t turn, Error const& error) {
    sendToSession(sessionId, makeErrorMessage(error, details({{"turn", Value{turn}}})));
}

} // namespace TS
