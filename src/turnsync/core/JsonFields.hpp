#pragma once

#include "core/Error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Field readers shared by the wire, delta and archive codecs. Every reader reports a
// MalformedInput error naming the offending field.
namespace TS::JsonFields {

using Json = nlohmann::json;

[[nodiscard]] auto makeError(Error::Code code, std::string_view field, std::string_view detail) -> Error;

[[nodiscard]] auto ensureObject(Json const& json, std::string_view context) -> Expected<void>;
[[nodiscard]] auto readString(Json const& json, char const* key) -> Expected<std::string>;
[[nodiscard]] auto readOptionalString(Json const& json, char const* key) -> Expected<std::optional<std::string>>;
[[nodiscard]] auto readUuid(Json const& json, char const* key) -> Expected<std::string>;
[[nodiscard]] auto readBoolean(Json const& json, char const* key) -> Expected<bool>;
[[nodiscard]] auto readUint64(Json const& json, char const* key) -> Expected<std::uint64_t>;
[[nodiscard]] auto readInt64(Json const& json, char const* key) -> Expected<std::int64_t>;
[[nodiscard]] auto readNumber(Json const& json, char const* key) -> Expected<double>;
[[nodiscard]] auto readStringArray(Json const& json, char const* key) -> Expected<std::vector<std::string>>;
[[nodiscard]] auto readArray(Json const& json, char const* key) -> Expected<Json const*>;

// dump() that never throws: bytes that are not UTF-8 are written as U+FFFD.
[[nodiscard]] auto writeDocument(Json const& json, int indent = -1) -> std::string;

[[nodiscard]] auto parseDocument(std::string_view text, std::string_view context) -> Expected<Json>;

} // namespace TS::JsonFields
