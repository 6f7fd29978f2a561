#include "delta/DeltaValidator.hpp"

#include "core/ValueJson.hpp"

#include <string>

namespace TS::DeltaValidator {

namespace {

auto describe(Delta const& delta) -> std::string {
    return std::string(deltaOpToString(delta.op)) + " " + delta.target + ":" + delta.path;
}

auto typeMismatch(Delta const& delta, std::string_view expected, Value const* found) -> Error {
    std::string message = describe(delta) + " requires " + std::string(expected);
    message.append(", found ");
    message.append(found ? kindToString(found->kind()) : std::string_view{"nothing"});
    return Error{Error::Code::TypeMismatch, std::move(message)};
}

// Delete of a slot whose container exists but does not hold it.
auto checkDeleteTarget(Value const& state, DeltaPath const& absolute, Delta const& delta) -> Expected<void> {
    auto parent = PathResolver::resolve(state, absolute.parent());
    if (!parent) {
        return std::unexpected(parent.error());
    }
    auto const& step = absolute.terminal();
    bool const absent = (step.kind == PathStep::Kind::Key && parent->isObject() && !parent->find(step.name))
                        || (step.kind == PathStep::Kind::Index && parent->isArray()
                            && step.position >= parent->size());
    if (absent) {
        return std::unexpected(Error{Error::Code::NotFound, describe(delta) + " addresses nothing"});
    }
    return {};
}

} // namespace

auto locate(Value const& state, Delta const& delta) -> Expected<Location> {
    auto relative = parseDeltaPath(delta.path);
    if (!relative) {
        return std::unexpected(relative.error());
    }
    if (relative->hasInnerAppend() || (relative->endsWithAppend() && delta.op != DeltaOp::Push)) {
        return std::unexpected(Error{Error::Code::InvalidWildcardUsage,
                                     describe(delta) + ": [*] is only valid as the last step of a push"});
    }
    auto target = parseTarget(delta.target);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto root = target->rootPath();
    if (auto present = PathResolver::resolve(state, root); !present) {
        return std::unexpected(Error{Error::Code::NotFound, "target '" + delta.target + "' is not present in state"});
    }
    auto absolute = root.joined(*relative);
    return Location{std::move(*target), std::move(*relative), std::move(absolute)};
}

auto mutateOptionsFor(DeltaOp op, DeltaPath const& path) -> PathResolver::MutateOptions {
    PathResolver::MutateOptions options;
    switch (op) {
    case DeltaOp::Set:
        options.createMissingKey    = true;
        options.missingIntermediate = Error::Code::MissingParent;
        break;
    case DeltaOp::Push:
        options.allowAppend         = path.endsWithAppend();
        options.missingIntermediate = Error::Code::MissingParent;
        break;
    case DeltaOp::Delete:
    case DeltaOp::Pull:
    case DeltaOp::Increment:
        options.missingIntermediate = Error::Code::MissingKey;
        break;
    }
    return options;
}

auto findElement(Value const& array, Value const& needle) -> Expected<std::size_t> {
    auto const& items = array.asArray();
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i] == needle) {
            return i;
        }
    }
    return std::unexpected(Error{Error::Code::ElementNotFound, "no element equal to the pulled value"});
}

auto checkSlot(Delta const& delta, Value const* current) -> Expected<void> {
    switch (delta.op) {
    case DeltaOp::Set:
        return {};
    case DeltaOp::Delete:
        if (!current) {
            return std::unexpected(Error{Error::Code::NotFound, describe(delta) + " addresses nothing"});
        }
        return {};
    case DeltaOp::Push:
        // A wildcard append receives no slot; the resolver already checked the parent array.
        if (current && !current->isArray()) {
            return std::unexpected(typeMismatch(delta, "an array", current));
        }
        return {};
    case DeltaOp::Pull: {
        if (!current || !current->isArray()) {
            return std::unexpected(typeMismatch(delta, "an array", current));
        }
        auto index = findElement(*current, delta.value);
        if (!index) {
            return std::unexpected(Error{Error::Code::ElementNotFound,
                                         describe(delta) + ": no element equal to the pulled value"});
        }
        return {};
    }
    case DeltaOp::Increment:
        if (!current || !current->isNumber()) {
            return std::unexpected(typeMismatch(delta, "a number", current));
        }
        if (!delta.value.isNumber()) {
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         describe(delta) + " needs a numeric value, got "
                                             + std::string(kindToString(delta.value.kind()))});
        }
        return {};
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled delta op"});
}

auto validate(Value const& state, Delta const& delta) -> Expected<void> {
    auto location = locate(state, delta);
    if (!location) {
        return std::unexpected(location.error());
    }
    if (holdsInvalidUtf8(delta.value)) {
        return std::unexpected(Error{Error::Code::MalformedInput, describe(delta) + " carries text that is not valid UTF-8"});
    }
    if (delta.op == DeltaOp::Delete) {
        if (auto present = checkDeleteTarget(state, location->absolute, delta); !present) {
            return present;
        }
    }
    auto probe = PathResolver::mutate(
            state,
            location->absolute,
            [&delta](Value const* current) -> Expected<std::optional<Value>> {
                if (auto ok = checkSlot(delta, current); !ok) {
                    return std::unexpected(ok.error());
                }
                if (!current) {
                    return std::optional<Value>{};
                }
                return std::optional<Value>{*current};
            },
            mutateOptionsFor(delta.op, location->relative));
    if (!probe) {
        return std::unexpected(probe.error());
    }
    return {};
}

} // namespace TS::DeltaValidator
