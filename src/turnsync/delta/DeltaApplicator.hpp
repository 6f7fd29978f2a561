#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "delta/Delta.hpp"

namespace TS::DeltaApplicator {

struct Applied {
    Value state;
    // The input delta with previousValue filled in from the pre-mutation slot.
    Delta effective;
};

/**
 * Validates and applies one delta.
 *
 * set        replaces (or creates) the value at the path
 * delete     removes the key or element; later array elements shift down by one
 * push       appends to the array at the path, or at the parent of a [*] path
 * pull       removes the first element deep-equal to value
 * increment  adds value; integer + integer stays integral, otherwise double
 *
 * `state` is never modified; the returned tree shares every untouched subtree with it.
 */
[[nodiscard]] auto apply(Value const& state, Delta const& delta) -> Expected<Applied>;

// Undoes an effective delta previously returned by apply() against the state it produced.
[[nodiscard]] auto revert(Value const& state, Delta const& effective) -> Expected<Value>;

} // namespace TS::DeltaApplicator
