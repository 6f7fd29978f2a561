#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"
#include "storage/SessionArchive.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace TS::Protocol {

namespace EventTypes {
inline constexpr std::string_view TurnStart     = "TURN_START";
inline constexpr std::string_view TurnEnd       = "TURN_END";
inline constexpr std::string_view StateDelta    = "STATE_DELTA";
inline constexpr std::string_view SystemMessage = "SYSTEM_MESSAGE";
} // namespace EventTypes

/**
 * A game event as broadcast to subscribers. The base fields are common to every
 * event type; `fields` carries the type-specific members (an object) and is merged
 * into the same JSON document on the wire.
 */
struct GameEvent {
    std::string   type;
    std::string   id;
    std::string   timestamp;
    std::uint64_t turn = 0;
    std::string   sessionId;
    Value         fields = Value::object();
};

// Client -> server
struct CommandRequest {
    Value command; // opaque to the engine; carries at least a UUID "id"

    [[nodiscard]] auto commandId() const -> std::string;
};
struct GetStateRequest {};
struct GetStateAtTurnRequest {
    std::uint64_t turn = 0;
};
struct PingRequest {
    double timestamp = 0;
};
struct SubscribeRequest {
    std::vector<std::string> eventTypes;
};
struct ListSessionsRequest {};
struct LoadSessionRequest {
    std::string sessionId;
};
struct NewSessionRequest {
    std::string themeName;
    std::string playerName;
    Value       characterTemplate;
};

using ClientMessage = std::variant<CommandRequest,
                                   GetStateRequest,
                                   GetStateAtTurnRequest,
                                   PingRequest,
                                   SubscribeRequest,
                                   ListSessionsRequest,
                                   LoadSessionRequest,
                                   NewSessionRequest>;

// Server -> client
struct EventMessage {
    GameEvent event;
};
struct EventsMessage {
    std::vector<GameEvent> events;
};
struct StateMessage {
    Value state;
};
struct PongMessage {
    double        timestamp  = 0;
    std::uint64_t serverTime = 0;
};
struct ErrorMessage {
    std::string          code;
    std::string          message;
    std::optional<Value> details;
};
struct SessionListMessage {
    std::vector<SessionSummary> sessions;
};
struct SessionLoadedMessage {
    std::string sessionId;
    Value       state;
};
struct AckMessage {
    std::string                commandId;
    bool                       success = true;
    std::optional<std::string> error;
};

using ServerMessage = std::variant<EventMessage,
                                   EventsMessage,
                                   StateMessage,
                                   PongMessage,
                                   ErrorMessage,
                                   SessionListMessage,
                                   SessionLoadedMessage,
                                   AckMessage>;

[[nodiscard]] auto messageType(ClientMessage const& message) -> std::string_view;
[[nodiscard]] auto messageType(ServerMessage const& message) -> std::string_view;

[[nodiscard]] auto eventToJson(GameEvent const& event) -> nlohmann::json;
[[nodiscard]] auto eventFromJson(nlohmann::json const& json) -> Expected<GameEvent>;

[[nodiscard]] auto serializeClientMessage(ClientMessage const& message) -> std::string;
[[nodiscard]] auto deserializeClientMessage(std::string_view payload) -> Expected<ClientMessage>;
[[nodiscard]] auto serializeServerMessage(ServerMessage const& message) -> std::string;
[[nodiscard]] auto deserializeServerMessage(std::string_view payload) -> Expected<ServerMessage>;

// Event builders; id and timestamp are generated.
[[nodiscard]] auto makeStateDeltaEvent(std::string const& sessionId, Delta const& effective) -> GameEvent;
[[nodiscard]] auto makeTurnStartEvent(std::string const& sessionId, std::uint64_t turn, Value const& state) -> GameEvent;
[[nodiscard]] auto makeTurnEndEvent(std::string const& sessionId,
                                    TurnDeltas const& batch,
                                    std::size_t rejected) -> GameEvent;
[[nodiscard]] auto makeSystemMessageEvent(std::string const& sessionId,
                                          std::uint64_t turn,
                                          std::string_view level,
                                          std::string message) -> GameEvent;

[[nodiscard]] auto makeErrorMessage(Error const& error, std::optional<Value> details = std::nullopt) -> ErrorMessage;

} // namespace TS::Protocol
