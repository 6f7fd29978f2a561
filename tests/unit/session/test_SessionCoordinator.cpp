#include "session/SessionCoordinator.hpp"

#include "TurnSyncTestHelpers.hpp"

#include <mutex>

using namespace TS;
using namespace TS::Protocol;
using TS::Testing::makeDelta;
using TS::Testing::TempDirectory;

namespace {

class RecordingSink final : public MessageSink {
public:
    void send(ServerMessage const& message) override {
        std::lock_guard<std::mutex> lock(mutex);
        messages.push_back(message);
    }

    auto all() -> std::vector<ServerMessage> {
        std::lock_guard<std::mutex> lock(mutex);
        return messages;
    }

    template <typename T>
    auto last() -> std::optional<T> {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
            if (auto const* found = std::get_if<T>(&*it)) {
                return *found;
            }
        }
        return std::nullopt;
    }

    template <typename T>
    auto count() -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (auto const& message : messages) {
            n += std::holds_alternative<T>(message) ? 1 : 0;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        messages.clear();
    }

private:
    std::mutex                 mutex;
    std::vector<ServerMessage> messages;
};

// {"id": ..., "action": "damage", "amount": n} hurts the player; "wait" ends the turn
// with nothing; "steal" pulls an item the player does not own.
class ScriptedHandler final : public CommandHandler {
public:
    auto handle(CommandContext const& context, Value const& command) -> Expected<CommandOutcome> override {
        auto const* action = command.find("action");
        if (!action || !action->isString()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "command needs an action"});
        }
        CommandOutcome outcome;
        outcome.endTurn = true;
        if (action->asString() == "damage") {
            auto const* amount = command.find("amount");
            outcome.deltas.push_back(makeDelta(context.openTurn, "player", "hp", DeltaOp::Increment,
                                               Value{-(amount ? amount->asInteger() : 1)}));
        } else if (action->asString() == "steal") {
            outcome.deltas.push_back(makeDelta(context.openTurn, "player", "inventory", DeltaOp::Pull, Value{"crown"}));
        } else if (action->asString() != "wait") {
            return std::unexpected(Error{Error::Code::MalformedInput, "unknown action " + action->asString()});
        }
        return outcome;
    }
};

auto command(std::string const& action, std::int64_t amount = 1) -> CommandRequest {
    return CommandRequest{Value::object({{"id", Value{generateUuid()}},
                                         {"action", Value{action}},
                                         {"amount", Value{amount}}})};
}

auto newSession(SessionCoordinator& coordinator, SessionCoordinator::ConnectionId connection, RecordingSink& sink)
        -> std::string {
    coordinator.handle(connection, NewSessionRequest{"fantasy", "Aria", Value::object({{"hp", Value{10}},
                                                                                      {"inventory", Value::array()}})});
    auto loaded = sink.last<SessionLoadedMessage>();
    REQUIRE(loaded.has_value());
    return loaded->sessionId;
}

} // namespace

TEST_SUITE("SessionCoordinator") {
    TEST_CASE("new sessions start from the character template") {
        SessionCoordinator coordinator(EngineConfig{});
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        auto               sessionId  = newSession(coordinator, connection, *sink);

        CHECK(isUuid(sessionId));
        CHECK(coordinator.sessionCount() == 1);
        auto loaded = sink->last<SessionLoadedMessage>();
        CHECK(*loaded->state.find("sessionId") == Value{sessionId});
        CHECK(*loaded->state.find("turn") == Value{0});
        CHECK(*loaded->state.find("player")->find("name") == Value{"Aria"});
        CHECK(*loaded->state.find("world")->find("theme") == Value{"fantasy"});
        CHECK(loaded->state.find("npcs")->isObject());
    }

    TEST_CASE("ping answers with pong") {
        SessionCoordinator coordinator(EngineConfig{});
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        coordinator.handle(connection, PingRequest{42.0});
        auto pong = sink->last<PongMessage>();
        REQUIRE(pong.has_value());
        CHECK(pong->timestamp == doctest::Approx(42.0));
        CHECK(pong->serverTime > 0);
    }

    TEST_CASE("unbound connections cannot read state") {
        SessionCoordinator coordinator(EngineConfig{});
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        coordinator.handle(connection, GetStateRequest{});
        auto error = sink->last<ErrorMessage>();
        REQUIRE(error.has_value());
        CHECK(error->code == "session_not_found");
    }

    TEST_CASE("commands become deltas and committed turns are broadcast") {
        SessionCoordinator coordinator(EngineConfig{}, std::make_shared<ScriptedHandler>());
        auto               player     = std::make_shared<RecordingSink>();
        auto               watcher    = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(player);
        auto               sessionId  = newSession(coordinator, connection, *player);
        auto               observer   = coordinator.connect(watcher);
        coordinator.handle(observer, LoadSessionRequest{sessionId});
        player->clear();
        watcher->clear();

        auto request = command("damage", 3);
        coordinator.handle(connection, request);

        auto ack = player->last<AckMessage>();
        REQUIRE(ack.has_value());
        CHECK(ack->commandId == request.commandId());
        CHECK(ack->success);

        for (auto* sink : {player.get(), watcher.get()}) {
            auto events = sink->last<EventsMessage>();
            REQUIRE(events.has_value());
            REQUIRE(events->events.size() == 3);
            CHECK(events->events[0].type == EventTypes::StateDelta);
            CHECK(events->events[1].type == EventTypes::TurnEnd);
            CHECK(events->events[2].type == EventTypes::TurnStart);
            CHECK(events->events[2].turn == 2);
        }

        coordinator.handle(connection, GetStateRequest{});
        auto state = player->last<StateMessage>();
        REQUIRE(state.has_value());
        CHECK(*state->state.find("player")->find("hp") == Value{7});
        CHECK(*state->state.find("turn") == Value{1});
    }

    TEST_CASE("subscriptions filter broadcast events") {
        SessionCoordinator coordinator(EngineConfig{}, std::make_shared<ScriptedHandler>());
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        (void)newSession(coordinator, connection, *sink);
        coordinator.handle(connection, SubscribeRequest{{"TURN_END"}});

        coordinator.handle(connection, command("damage"));
        auto events = sink->last<EventsMessage>();
        REQUIRE(events.has_value());
        REQUIRE(events->events.size() == 1);
        CHECK(events->events[0].type == "TURN_END");

        sink->clear();
        coordinator.handle(connection, SubscribeRequest{{"SYSTEM_MESSAGE"}});
        coordinator.handle(connection, command("wait"));
        CHECK(sink->count<EventsMessage>() == 0);
        CHECK(sink->count<AckMessage>() == 1);
    }

    TEST_CASE("rejected deltas are reported as errors") {
        SessionCoordinator coordinator(EngineConfig{}, std::make_shared<ScriptedHandler>());
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        (void)newSession(coordinator, connection, *sink);

        coordinator.handle(connection, command("steal"));
        auto error = sink->last<ErrorMessage>();
        REQUIRE(error.has_value());
        CHECK(error->code == "element_not_found");
        REQUIRE(error->details.has_value());
        CHECK(error->details->find("deltaId") != nullptr);
    }

    TEST_CASE("handler failures and a missing handler are acknowledged as failures") {
        SessionCoordinator coordinator(EngineConfig{}, std::make_shared<ScriptedHandler>());
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        (void)newSession(coordinator, connection, *sink);
        coordinator.handle(connection, command("dance"));
        auto ack = sink->last<AckMessage>();
        REQUIRE(ack.has_value());
        CHECK_FALSE(ack->success);

        SessionCoordinator bare(EngineConfig{});
        auto               other = std::make_shared<RecordingSink>();
        auto               id    = bare.connect(other);
        (void)newSession(bare, id, *other);
        bare.handle(id, command("damage"));
        CHECK(other->last<ErrorMessage>()->code == "no_handler");
        CHECK_FALSE(other->last<AckMessage>()->success);
    }

    TEST_CASE("undecodable text is answered with an error") {
        SessionCoordinator coordinator(EngineConfig{});
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        coordinator.handleText(connection, "{\"type\": 12}");
        auto error = sink->last<ErrorMessage>();
        REQUIRE(error.has_value());
        CHECK(error->code == "malformed_input");

        coordinator.handleText(connection, R"({"type": "PING", "timestamp": 5})");
        CHECK(sink->last<PongMessage>().has_value());
    }

    TEST_CASE("history queries go through the bound session") {
        SessionCoordinator coordinator(EngineConfig{}, std::make_shared<ScriptedHandler>());
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        (void)newSession(coordinator, connection, *sink);
        coordinator.handle(connection, command("damage", 2));
        coordinator.handle(connection, command("damage", 2));

        coordinator.handle(connection, GetStateAtTurnRequest{1});
        auto state = sink->last<StateMessage>();
        REQUIRE(state.has_value());
        CHECK(*state->state.find("player")->find("hp") == Value{8});

        coordinator.handle(connection, GetStateAtTurnRequest{9});
        CHECK(sink->last<ErrorMessage>()->code == "not_found");
    }

    TEST_CASE("closed sessions are archived and can be loaded again") {
        TempDirectory dir;
        EngineConfig  config;
        config.storeRoot = dir.path();
        std::string sessionId;
        {
            SessionCoordinator coordinator(config, std::make_shared<ScriptedHandler>());
            auto               sink       = std::make_shared<RecordingSink>();
            auto               connection = coordinator.connect(sink);
            sessionId                     = newSession(coordinator, connection, *sink);
            coordinator.handle(connection, command("damage", 4));
            REQUIRE(coordinator.closeSession(sessionId).has_value());
            CHECK(coordinator.sessionCount() == 0);

            auto listed = coordinator.listSessions();
            REQUIRE(listed.has_value());
            REQUIRE(listed->size() == 1);
            CHECK(listed->front().id == sessionId);
            CHECK(listed->front().turn == 1);
        }

        SessionCoordinator coordinator(config, std::make_shared<ScriptedHandler>());
        auto               sink       = std::make_shared<RecordingSink>();
        auto               connection = coordinator.connect(sink);
        coordinator.handle(connection, LoadSessionRequest{sessionId});
        auto loaded = sink->last<SessionLoadedMessage>();
        REQUIRE(loaded.has_value());
        CHECK(*loaded->state.find("turn") == Value{1});
        CHECK(*loaded->state.find("player")->find("hp") == Value{6});

        coordinator.handle(connection, command("damage", 1));
        CHECK(coordinator.findSession(sessionId)->currentTurn() == 2);

        coordinator.handle(connection, LoadSessionRequest{generateUuid()});
        CHECK(sink->last<ErrorMessage>()->code == "session_not_found");
    }

    TEST_CASE("direct submission honours idempotency") {
        SessionCoordinator coordinator(EngineConfig{});
        auto               sessionId = coordinator.createSession(NewSessionRequest{"noir", "Sam", Value{}});
        REQUIRE(sessionId.has_value());
        auto delta = makeDelta(1, "player", "name", DeltaOp::Set, Value{"Samuel"});
        auto first = coordinator.submitDelta(*sessionId, delta);
        REQUIRE(first.has_value());
        CHECK(first->status == TurnSequencer::Submitted::Status::Queued);
        REQUIRE(coordinator.closeTurn(*sessionId).has_value());
        auto again = coordinator.submitDelta(*sessionId, delta);
        REQUIRE(again.has_value());
        CHECK(again->status == TurnSequencer::Submitted::Status::Duplicate);

        auto missing = coordinator.submitDelta(generateUuid(), delta);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::SessionNotFound);
    }

    TEST_CASE("idle sessions are evicted only when eviction is enabled") {
        EngineConfig disabled;
        SessionCoordinator keep(disabled);
        REQUIRE(keep.createSession(NewSessionRequest{"noir", "Sam", Value{}}).has_value());
        CHECK(keep.evictIdle(std::chrono::steady_clock::now() + std::chrono::hours{1}).empty());
        CHECK(keep.sessionCount() == 1);

        EngineConfig enabled;
        enabled.session.idleEviction = std::chrono::minutes{5};
        SessionCoordinator evict(enabled);
        auto               id = evict.createSession(NewSessionRequest{"noir", "Sam", Value{}});
        REQUIRE(id.has_value());
        CHECK(evict.evictIdle(std::chrono::steady_clock::now()).empty());
        auto evicted = evict.evictIdle(std::chrono::steady_clock::now() + std::chrono::minutes{6});
        REQUIRE(evicted.size() == 1);
        CHECK(evicted.front() == *id);
        CHECK(evict.sessionCount() == 0);
    }
}
