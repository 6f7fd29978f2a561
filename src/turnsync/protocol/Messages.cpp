#include "protocol/Messages.hpp"

#include "core/Identifiers.hpp"
#include "core/JsonFields.hpp"
#include "core/ValueJson.hpp"
#include "delta/DeltaCodec.hpp"

#include <algorithm>
#include <array>

namespace TS::Protocol {

using namespace JsonFields;

namespace {

constexpr std::array<std::string_view, 5> kEventBaseFields{"type", "id", "timestamp", "turn", "sessionId"};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto stringMember(Value const& object, std::string_view key) -> std::string {
    if (auto const* member = object.find(key); member && member->isString()) {
        return member->asString();
    }
    return {};
}

auto summaryToJson(SessionSummary const& summary) -> Json {
    return Json{{"id", summary.id},
                {"name", summary.name},
                {"theme", summary.theme},
                {"turn", summary.turn},
                {"lastPlayed", summary.lastPlayed}};
}

auto summaryFromJson(Json const& json) -> Expected<SessionSummary> {
    if (auto ok = ensureObject(json, "sessions"); !ok) {
        return std::unexpected(ok.error());
    }
    SessionSummary summary;
    auto id = readUuid(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    summary.id = std::move(*id);
    auto name = readString(json, "name");
    if (!name) {
        return std::unexpected(name.error());
    }
    summary.name = std::move(*name);
    auto theme = readString(json, "theme");
    if (!theme) {
        return std::unexpected(theme.error());
    }
    summary.theme = std::move(*theme);
    auto turn = readUint64(json, "turn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    summary.turn = *turn;
    auto lastPlayed = readString(json, "lastPlayed");
    if (!lastPlayed) {
        return std::unexpected(lastPlayed.error());
    }
    summary.lastPlayed = std::move(*lastPlayed);
    return summary;
}

auto newEvent(std::string_view type, std::string const& sessionId, std::uint64_t turn) -> GameEvent {
    GameEvent event;
    event.type      = std::string(type);
    event.id        = generateUuid();
    event.timestamp = nowTimestamp();
    event.turn      = turn;
    event.sessionId = sessionId;
    return event;
}

auto requireMember(Json const& json, char const* key) -> Expected<Json const*> {
    if (auto it = json.find(key); it != json.end()) {
        return &*it;
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

} // namespace

auto CommandRequest::commandId() const -> std::string {
    return stringMember(command, "id");
}

auto messageType(ClientMessage const& message) -> std::string_view {
    return std::visit(Overloaded{
                              [](CommandRequest const&) -> std::string_view { return "COMMAND"; },
                              [](GetStateRequest const&) -> std::string_view { return "GET_STATE"; },
                              [](GetStateAtTurnRequest const&) -> std::string_view { return "GET_STATE_AT_TURN"; },
                              [](PingRequest const&) -> std::string_view { return "PING"; },
                              [](SubscribeRequest const&) -> std::string_view { return "SUBSCRIBE"; },
                              [](ListSessionsRequest const&) -> std::string_view { return "LIST_SESSIONS"; },
                              [](LoadSessionRequest const&) -> std::string_view { return "LOAD_SESSION"; },
                              [](NewSessionRequest const&) -> std::string_view { return "NEW_SESSION"; },
                      },
                      message);
}

auto messageType(ServerMessage const& message) -> std::string_view {
    return std::visit(Overloaded{
                              [](EventMessage const&) -> std::string_view { return "EVENT"; },
                              [](EventsMessage const&) -> std::string_view { return "EVENTS"; },
                              [](StateMessage const&) -> std::string_view { return "STATE"; },
                              [](PongMessage const&) -> std::string_view { return "PONG"; },
                              [](ErrorMessage const&) -> std::string_view { return "ERROR"; },
                              [](SessionListMessage const&) -> std::string_view { return "SESSION_LIST"; },
                              [](SessionLoadedMessage const&) -> std::string_view { return "SESSION_LOADED"; },
                              [](AckMessage const&) -> std::string_view { return "ACK"; },
                      },
                      message);
}

auto eventToJson(GameEvent const& event) -> nlohmann::json {
    Json json = event.fields.isObject() ? toJson(event.fields) : Json::object();
    json["type"]      = event.type;
    json["id"]        = event.id;
    json["timestamp"] = event.timestamp;
    json["turn"]      = event.turn;
    json["sessionId"] = event.sessionId;
    return json;
}

auto eventFromJson(nlohmann::json const& json) -> Expected<GameEvent> {
    if (auto ok = ensureObject(json, "event"); !ok) {
        return std::unexpected(ok.error());
    }
    GameEvent event;
    auto type = readString(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }
    event.type = std::move(*type);
    auto id = readUuid(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    event.id = std::move(*id);
    auto timestamp = readString(json, "timestamp");
    if (!timestamp) {
        return std::unexpected(timestamp.error());
    }
    event.timestamp = std::move(*timestamp);
    auto turn = readUint64(json, "turn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    event.turn = *turn;
    auto sessionId = readUuid(json, "sessionId");
    if (!sessionId) {
        return std::unexpected(sessionId.error());
    }
    event.sessionId = std::move(*sessionId);

    Json fields = Json::object();
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (std::find(kEventBaseFields.begin(), kEventBaseFields.end(), it.key()) == kEventBaseFields.end()) {
            fields[it.key()] = it.value();
        }
    }
    event.fields = fromJson(fields);
    return event;
}

auto serializeClientMessage(ClientMessage const& message) -> std::string {
    Json json = std::visit(
            Overloaded{
                    [](CommandRequest const& m) { return Json{{"command", toJson(m.command)}}; },
                    [](GetStateRequest const&) { return Json::object(); },
                    [](GetStateAtTurnRequest const& m) { return Json{{"turn", m.turn}}; },
                    [](PingRequest const& m) { return Json{{"timestamp", m.timestamp}}; },
                    [](SubscribeRequest const& m) { return Json{{"eventTypes", m.eventTypes}}; },
                    [](ListSessionsRequest const&) { return Json::object(); },
                    [](LoadSessionRequest const& m) { return Json{{"sessionId", m.sessionId}}; },
                    [](NewSessionRequest const& m) {
                        return Json{{"themeName", m.themeName},
                                    {"playerName", m.playerName},
                                    {"characterTemplate", toJson(m.characterTemplate)}};
                    },
            },
            message);
    json["type"] = std::string(messageType(message));
    return JsonFields::writeDocument(json);
}

auto deserializeClientMessage(std::string_view payload) -> Expected<ClientMessage> {
    auto parsed = parseDocument(payload, "message");
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    auto const& json = *parsed;
    auto        type = readString(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "COMMAND") {
        auto command = requireMember(json, "command");
        if (!command) {
            return std::unexpected(command.error());
        }
        if (!(*command)->is_object()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, "command", "must be an object"));
        }
        if (auto id = readUuid(**command, "id"); !id) {
            return std::unexpected(makeError(Error::Code::MalformedInput, "command.id", "must be a UUID"));
        }
        return CommandRequest{fromJson(**command)};
    }
    if (*type == "GET_STATE") {
        return GetStateRequest{};
    }
    if (*type == "GET_STATE_AT_TURN") {
        auto turn = readUint64(json, "turn");
        if (!turn) {
            return std::unexpected(turn.error());
        }
        return GetStateAtTurnRequest{*turn};
    }
    if (*type == "PING") {
        auto timestamp = readNumber(json, "timestamp");
        if (!timestamp) {
            return std::unexpected(timestamp.error());
        }
        return PingRequest{*timestamp};
    }
    if (*type == "SUBSCRIBE") {
        auto eventTypes = readStringArray(json, "eventTypes");
        if (!eventTypes) {
            return std::unexpected(eventTypes.error());
        }
        return SubscribeRequest{std::move(*eventTypes)};
    }
    if (*type == "LIST_SESSIONS") {
        return ListSessionsRequest{};
    }
    if (*type == "LOAD_SESSION") {
        auto sessionId = readUuid(json, "sessionId");
        if (!sessionId) {
            return std::unexpected(sessionId.error());
        }
        return LoadSessionRequest{std::move(*sessionId)};
    }
    if (*type == "NEW_SESSION") {
        auto themeName = readString(json, "themeName");
        if (!themeName) {
            return std::unexpected(themeName.error());
        }
        auto playerName = readString(json, "playerName");
        if (!playerName) {
            return std::unexpected(playerName.error());
        }
        Value characterTemplate;
        if (auto it = json.find("characterTemplate"); it != json.end()) {
            characterTemplate = fromJson(*it);
        }
        return NewSessionRequest{std::move(*themeName), std::move(*playerName), std::move(characterTemplate)};
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, "type", "unknown message type '" + *type + "'"));
}

auto serializeServerMessage(ServerMessage const& message) -> std::string {
    Json json = std::visit(
            Overloaded{
                    [](EventMessage const& m) { return Json{{"event", eventToJson(m.event)}}; },
                    [](EventsMessage const& m) {
                        Json events = Json::array();
                        for (auto const& event : m.events) {
                            events.push_back(eventToJson(event));
                        }
                        return Json{{"events", std::move(events)}};
                    },
                    [](StateMessage const& m) { return Json{{"state", toJson(m.state)}}; },
                    [](PongMessage const& m) { return Json{{"timestamp", m.timestamp}, {"serverTime", m.serverTime}}; },
                    [](ErrorMessage const& m) {
                        Json body{{"code", m.code}, {"message", m.message}};
                        if (m.details) {
                            body["details"] = toJson(*m.details);
                        }
                        return body;
                    },
                    [](SessionListMessage const& m) {
                        Json sessions = Json::array();
                        for (auto const& summary : m.sessions) {
                            sessions.push_back(summaryToJson(summary));
                        }
                        return Json{{"sessions", std::move(sessions)}};
                    },
                    [](SessionLoadedMessage const& m) {
                        return Json{{"sessionId", m.sessionId}, {"state", toJson(m.state)}};
                    },
                    [](AckMessage const& m) {
                        Json body{{"commandId", m.commandId}, {"success", m.success}};
                        if (m.error) {
                            body["error"] = *m.error;
                        }
                        return body;
                    },
            },
            message);
    json["type"] = std::string(messageType(message));
    return JsonFields::writeDocument(json);
}

auto deserializeServerMessage(std::string_view payload) -> Expected<ServerMessage> {
    auto parsed = parseDocument(payload, "message");
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    auto const& json = *parsed;
    auto        type = readString(json, "type");
    if (!type) {
        return std::unexpected(type.error());
    }

    if (*type == "EVENT") {
        auto member = requireMember(json, "event");
        if (!member) {
            return std::unexpected(member.error());
        }
        auto event = eventFromJson(**member);
        if (!event) {
            return std::unexpected(event.error());
        }
        return EventMessage{std::move(*event)};
    }
    if (*type == "EVENTS") {
        auto entries = readArray(json, "events");
        if (!entries) {
            return std::unexpected(entries.error());
        }
        EventsMessage message;
        for (auto const& entry : **entries) {
            auto event = eventFromJson(entry);
            if (!event) {
                return std::unexpected(event.error());
            }
            message.events.push_back(std::move(*event));
        }
        return message;
    }
    if (*type == "STATE") {
        auto state = requireMember(json, "state");
        if (!state) {
            return std::unexpected(state.error());
        }
        return StateMessage{fromJson(**state)};
    }
    if (*type == "PONG") {
        auto timestamp = readNumber(json, "timestamp");
        if (!timestamp) {
            return std::unexpected(timestamp.error());
        }
        auto serverTime = readUint64(json, "serverTime");
        if (!serverTime) {
            return std::unexpected(serverTime.error());
        }
        return PongMessage{*timestamp, *serverTime};
    }
    if (*type == "ERROR") {
        auto code = readString(json, "code");
        if (!code) {
            return std::unexpected(code.error());
        }
        auto text = readString(json, "message");
        if (!text) {
            return std::unexpected(text.error());
        }
        ErrorMessage message{std::move(*code), std::move(*text), std::nullopt};
        if (auto it = json.find("details"); it != json.end()) {
            message.details = fromJson(*it);
        }
        return message;
    }
    if (*type == "SESSION_LIST") {
        auto entries = readArray(json, "sessions");
        if (!entries) {
            return std::unexpected(entries.error());
        }
        SessionListMessage message;
        for (auto const& entry : **entries) {
            auto summary = summaryFromJson(entry);
            if (!summary) {
                return std::unexpected(summary.error());
            }
            message.sessions.push_back(std::move(*summary));
        }
        return message;
    }
    if (*type == "SESSION_LOADED") {
        auto sessionId = readUuid(json, "sessionId");
        if (!sessionId) {
            return std::unexpected(sessionId.error());
        }
        auto state = requireMember(json, "state");
        if (!state) {
            return std::unexpected(state.error());
        }
        return SessionLoadedMessage{std::move(*sessionId), fromJson(**state)};
    }
    if (*type == "ACK") {
        auto commandId = readString(json, "commandId");
        if (!commandId) {
            return std::unexpected(commandId.error());
        }
        auto success = readBoolean(json, "success");
        if (!success) {
            return std::unexpected(success.error());
        }
        auto error = readOptionalString(json, "error");
        if (!error) {
            return std::unexpected(error.error());
        }
        return AckMessage{std::move(*commandId), *success, std::move(*error)};
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, "type", "unknown message type '" + *type + "'"));
}

auto makeStateDeltaEvent(std::string const& sessionId, Delta const& effective) -> GameEvent {
    auto event   = newEvent(EventTypes::StateDelta, sessionId, effective.turn);
    event.fields = Value::object({{"delta", fromJson(deltaToJson(effective))}});
    return event;
}

auto makeTurnStartEvent(std::string const& sessionId, std::uint64_t turn, Value const& state) -> GameEvent {
    auto        event = newEvent(EventTypes::TurnStart, sessionId, turn);
    std::string activeCharacter;
    std::string sceneContext;
    if (auto const* player = state.find("player")) {
        activeCharacter = stringMember(*player, "name");
    }
    if (auto const* scene = state.find("currentScene")) {
        sceneContext = stringMember(*scene, "description");
        if (sceneContext.empty()) {
            sceneContext = stringMember(*scene, "name");
        }
    }
    event.fields = Value::object({{"activeCharacter", Value{activeCharacter}}, {"sceneContext", Value{sceneContext}}});
    return event;
}

auto makeTurnEndEvent(std::string const& sessionId, TurnDeltas const& batch, std::size_t rejected) -> GameEvent {
    auto event   = newEvent(EventTypes::TurnEnd, sessionId, batch.turn);
    auto summary = std::to_string(batch.deltas.size()) + " deltas committed, " + std::to_string(rejected) + " rejected";
    event.fields = Value::object({{"summary", Value{std::move(summary)}},
                                  {"checksum", Value{batch.checksum.value_or(std::string{})}},
                                  {"deltaCount", Value{batch.deltas.size()}}});
    return event;
}

auto makeSystemMessageEvent(std::string const& sessionId,
                            std::uint64_t turn,
                            std::string_view level,
                            std::string message) -> GameEvent {
    auto event   = newEvent(EventTypes::SystemMessage, sessionId, turn);
    event.fields = Value::object({{"level", Value{level}}, {"message", Value{std::move(message)}}});
    return event;
}

auto makeErrorMessage(Error const& error, std::optional<Value> details) -> ErrorMessage {
    return ErrorMessage{std::string(errorCodeToString(error.code)), error.message.value_or(std::string{}), std::move(details)};
}

} // namespace TS::Protocol
