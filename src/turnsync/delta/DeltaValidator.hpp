#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"
#include "path/DeltaPath.hpp"
#include "path/PathResolver.hpp"

namespace TS::DeltaValidator {

// Where a delta lands: its target, the path relative to the target sub-root, and the
// same path anchored at the session root.
struct Location {
    Target    target;
    DeltaPath relative;
    DeltaPath absolute;
};

// Parses path and target and checks that the target sub-root exists in `state`.
[[nodiscard]] auto locate(Value const& state, Delta const& delta) -> Expected<Location>;

// Resolver policy for an op: set may create the final key, push may append, and a
// missing intermediate key is a MissingParent for set/push and MissingKey otherwise.
[[nodiscard]] auto mutateOptionsFor(DeltaOp op, DeltaPath const& path) -> PathResolver::MutateOptions;

// Op/type preconditions on the slot the delta addresses. `current` is nullptr for a
// fresh key (set) or a wildcard append (push).
[[nodiscard]] auto checkSlot(Delta const& delta, Value const* current) -> Expected<void>;

// Index of the first element of `array` deep-equal to `needle`.
[[nodiscard]] auto findElement(Value const& array, Value const& needle) -> Expected<std::size_t>;

/**
 * Checks a delta against a state without mutating it, in order:
 *  1. path syntax and wildcard placement,
 *  2. target sub-root presence,
 *  3. op/type compatibility at the addressed location,
 *  4. for pull, presence of a deep-equal element.
 * Safe to call speculatively from any thread holding a state version.
 */
[[nodiscard]] auto validate(Value const& state, Delta const& delta) -> Expected<void>;

} // namespace TS::DeltaValidator
