#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"

#include <string>
#include <string_view>

namespace TS::Checksum {

// Published alongside the protocol; bump kVersion whenever the digest input changes.
inline constexpr std::string_view kAlgorithm = "sha256/canonical-json";
inline constexpr int              kVersion   = 1;
inline constexpr std::string_view kPrefix    = "sha256:";

// "sha256:" followed by the lowercase hex SHA-256 of canonicalJson(state).
[[nodiscard]] auto compute(Value const& state) -> Expected<std::string>;
[[nodiscard]] auto digestHex(std::string_view bytes) -> Expected<std::string>;

[[nodiscard]] auto matches(Value const& state, std::string_view expected) -> Expected<bool>;

} // namespace TS::Checksum
