#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "path/DeltaPath.hpp"

#include <functional>
#include <optional>

namespace TS::PathResolver {

struct MutateOptions {
    // The final object key may be absent; the transform then sees nullptr.
    bool        createMissingKey    = false;
    // A final [*] step is accepted and appends the transform result.
    bool        allowAppend         = false;
    // Reported when a key before the final step does not exist.
    Error::Code missingIntermediate = Error::Code::MissingParent;
};

// Receives the current value of the final slot (nullptr for a fresh key or an append)
// and returns its replacement; std::nullopt removes the slot.
using SlotTransform = std::function<Expected<std::optional<Value>>(Value const* current)>;

// Pure lookup of the value addressed by `path`.
[[nodiscard]] auto resolve(Value const& tree, DeltaPath const& path) -> Expected<Value>;

// Returns `tree` with the slot at `path` rewritten by `transform`. Only the containers
// on the way to the slot are copied; all other subtrees are shared with `tree`.
[[nodiscard]] auto mutate(Value const& tree,
                          DeltaPath const& path,
                          SlotTransform const& transform,
                          MutateOptions const& options = {}) -> Expected<Value>;

} // namespace TS::PathResolver
