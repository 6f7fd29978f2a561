#pragma once

#include "core/Error.hpp"
#include "delta/Delta.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace TS {

[[nodiscard]] auto deltaToJson(Delta const& delta) -> nlohmann::json;
[[nodiscard]] auto deltaFromJson(nlohmann::json const& json) -> Expected<Delta>;

[[nodiscard]] auto turnDeltasToJson(TurnDeltas const& batch) -> nlohmann::json;
// Rejects batches whose member deltas carry a turn other than the batch turn.
[[nodiscard]] auto turnDeltasFromJson(nlohmann::json const& json) -> Expected<TurnDeltas>;

[[nodiscard]] auto serializeDelta(Delta const& delta) -> std::string;
[[nodiscard]] auto deserializeDelta(std::string_view payload) -> Expected<Delta>;
[[nodiscard]] auto serializeTurnDeltas(TurnDeltas const& batch) -> std::string;
[[nodiscard]] auto deserializeTurnDeltas(std::string_view payload) -> Expected<TurnDeltas>;

} // namespace TS
