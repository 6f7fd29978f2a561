#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace TS {

[[nodiscard]] auto toJson(Value const& value) -> nlohmann::json;
[[nodiscard]] auto fromJson(nlohmann::json const& json) -> Value;

// Compact serialization with object keys in lexical order. Equal trees built from
// equal kinds always produce the same bytes; checksums are computed over this form.
[[nodiscard]] auto canonicalJson(Value const& value) -> std::string;

[[nodiscard]] auto parseValue(std::string_view text) -> Expected<Value>;

// Well-formed UTF-8 (RFC 3629): no overlong forms, surrogates or code points past U+10FFFF.
[[nodiscard]] auto isValidUtf8(std::string_view text) -> bool;
// True when any string or object key in the tree is not valid UTF-8.
[[nodiscard]] auto holdsInvalidUtf8(Value const& value) -> bool;

} // namespace TS
