#include "delta/DeltaApplicator.hpp"

#include "delta/DeltaValidator.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathResolver.hpp"

#include <cstdint>
#include <limits>

namespace TS::DeltaApplicator {

namespace {

auto addNumbers(Value const& lhs, Value const& rhs) -> Value {
    if (lhs.isInteger() && rhs.isInteger()) {
        auto const a        = lhs.asInteger();
        auto const b        = rhs.asInteger();
        bool const overflow = (b > 0 && a > std::numeric_limits<std::int64_t>::max() - b)
                              || (b < 0 && a < std::numeric_limits<std::int64_t>::min() - b);
        if (!overflow) {
            return Value{a + b};
        }
    }
    return Value{lhs.asDouble() + rhs.asDouble()};
}

auto missingPrevious(Delta const& effective) -> Error {
    return Error{Error::Code::MalformedInput,
                 "delta " + effective.id + " has no previousValue to restore"};
}

auto restore(Value const& state, DeltaPath const& absolute, Value previous) -> Expected<Value> {
    PathResolver::MutateOptions options;
    options.createMissingKey = true;
    return PathResolver::mutate(
            state,
            absolute,
            [&previous](Value const*) -> Expected<std::optional<Value>> { return std::optional<Value>{previous}; },
            options);
}

auto revertDelete(Value const& state, DeltaPath const& absolute, Value previous) -> Expected<Value> {
    auto const& step = absolute.terminal();
    if (step.kind == PathStep::Kind::Key) {
        return restore(state, absolute, std::move(previous));
    }
    auto const position = step.position;
    return PathResolver::mutate(
            state,
            absolute.parent(),
            [&previous, position](Value const* array) -> Expected<std::optional<Value>> {
                if (!array || !array->isArray() || position > array->size()) {
                    return std::unexpected(Error{Error::Code::IndexOutOfRange,
                                                 "cannot reinsert element at " + std::to_string(position)});
                }
                return std::optional<Value>{array->withInserted(position, previous)};
            });
}

auto revertPush(Value const& state, DeltaPath const& absolute, Delta const& effective) -> Expected<Value> {
    auto arrayPath = absolute.endsWithAppend() ? absolute.parent() : absolute;
    return PathResolver::mutate(state, arrayPath, [&effective](Value const* array) -> Expected<std::optional<Value>> {
        if (!array || !array->isArray() || array->size() == 0) {
            return std::unexpected(Error{Error::Code::ElementNotFound, "pushed element is no longer present"});
        }
        if (!(*array->at(array->size() - 1) == effective.value)) {
            return std::unexpected(Error{Error::Code::ElementNotFound, "last element differs from the pushed value"});
        }
        return std::optional<Value>{array->withoutElement(array->size() - 1)};
    });
}

} // namespace

auto apply(Value const& state, Delta const& delta) -> Expected<Applied> {
    if (auto valid = DeltaValidator::validate(state, delta); !valid) {
        ts_log("Rejected delta " + delta.id + ": " + describeError(valid.error()), "Delta");
        return std::unexpected(valid.error());
    }
    auto location = DeltaValidator::locate(state, delta);
    if (!location) {
        return std::unexpected(location.error());
    }

    std::optional<Value> previous;
    auto next = PathResolver::mutate(
            state,
            location->absolute,
            [&delta, &previous](Value const* current) -> Expected<std::optional<Value>> {
                if (current && delta.op != DeltaOp::Push) {
                    previous = *current;
                }
                switch (delta.op) {
                case DeltaOp::Set:
                    return std::optional<Value>{delta.value};
                case DeltaOp::Delete:
                    return std::optional<Value>{};
                case DeltaOp::Push:
                    if (!current) {
                        return std::optional<Value>{delta.value};
                    }
                    return std::optional<Value>{current->withAppended(delta.value)};
                case DeltaOp::Pull: {
                    auto index = DeltaValidator::findElement(*current, delta.value);
                    if (!index) {
                        return std::unexpected(index.error());
                    }
                    return std::optional<Value>{current->withoutElement(*index)};
                }
                case DeltaOp::Increment:
                    return std::optional<Value>{addNumbers(*current, delta.value)};
                }
                return std::unexpected(Error{Error::Code::UnknownError, "unhandled delta op"});
            },
            DeltaValidator::mutateOptionsFor(delta.op, location->relative));
    if (!next) {
        return std::unexpected(next.error());
    }

    Applied applied{std::move(*next), delta};
    applied.effective.previousValue = std::move(previous);
    return applied;
}

auto revert(Value const& state, Delta const& effective) -> Expected<Value> {
    auto location = DeltaValidator::locate(state, effective);
    if (!location) {
        return std::unexpected(location.error());
    }
    auto const& absolute = location->absolute;
    switch (effective.op) {
    case DeltaOp::Set:
        if (effective.previousValue) {
            return restore(state, absolute, *effective.previousValue);
        }
        return PathResolver::mutate(state, absolute, [](Value const*) -> Expected<std::optional<Value>> {
            return std::optional<Value>{};
        });
    case DeltaOp::Delete:
        if (!effective.previousValue) {
            return std::unexpected(missingPrevious(effective));
        }
        return revertDelete(state, absolute, *effective.previousValue);
    case DeltaOp::Push:
        return revertPush(state, absolute, effective);
    case DeltaOp::Pull:
    case DeltaOp::Increment:
        if (!effective.previousValue) {
            return std::unexpected(missingPrevious(effective));
        }
        return restore(state, absolute, *effective.previousValue);
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled delta op"});
}

} // namespace TS::DeltaApplicator
