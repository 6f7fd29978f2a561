#include "path/PathResolver.hpp"

#include <string>

namespace TS::PathResolver {

namespace {

auto describeStep(DeltaPath const& path, std::size_t depth) -> std::string {
    auto prefix = DeltaPath{std::vector<PathStep>(path.steps().begin(),
                                                  path.steps().begin() + static_cast<std::ptrdiff_t>(depth + 1))};
    return "'" + prefix.toString() + "'";
}

auto keyOnNonObject(DeltaPath const& path, std::size_t depth, Value const& node) -> Error {
    return Error{Error::Code::TypeMismatch,
                 describeStep(path, depth) + " addresses a key inside " + std::string(kindToString(node.kind()))};
}

auto indexError(DeltaPath const& path, std::size_t depth, Value const& node) -> Error {
    if (!node.isArray()) {
        return Error{Error::Code::IndexOutOfRange,
                     describeStep(path, depth) + " indexes into " + std::string(kindToString(node.kind()))};
    }
    return Error{Error::Code::IndexOutOfRange,
                 describeStep(path, depth) + " is out of range (size " + std::to_string(node.size()) + ")"};
}

auto wildcardError(DeltaPath const& path, std::size_t depth) -> Error {
    return Error{Error::Code::InvalidWildcardUsage,
                 describeStep(path, depth) + " uses [*] outside a terminal push"};
}

auto applyTerminal(Value const& node,
                   DeltaPath const& path,
                   std::size_t depth,
                   SlotTransform const& transform,
                   MutateOptions const& options) -> Expected<Value> {
    auto const& step = path.steps()[depth];
    switch (step.kind) {
    case PathStep::Kind::Key: {
        if (!node.isObject()) {
            return std::unexpected(keyOnNonObject(path, depth, node));
        }
        auto const* current = node.find(step.name);
        if (!current && !options.createMissingKey) {
            return std::unexpected(Error{Error::Code::MissingKey, describeStep(path, depth) + " does not exist"});
        }
        auto replacement = transform(current);
        if (!replacement) {
            return std::unexpected(replacement.error());
        }
        if (!replacement->has_value()) {
            return current ? node.withoutMember(step.name) : node;
        }
        return node.withMember(step.name, std::move(**replacement));
    }
    case PathStep::Kind::Index: {
        auto const* current = node.at(step.position);
        if (!current) {
            return std::unexpected(indexError(path, depth, node));
        }
        auto replacement = transform(current);
        if (!replacement) {
            return std::unexpected(replacement.error());
        }
        if (!replacement->has_value()) {
            return node.withoutElement(step.position);
        }
        return node.withElement(step.position, std::move(**replacement));
    }
    case PathStep::Kind::Append: {
        if (!options.allowAppend) {
            return std::unexpected(wildcardError(path, depth));
        }
        if (!node.isArray()) {
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         describeStep(path, depth) + " appends to "
                                             + std::string(kindToString(node.kind()))});
        }
        auto replacement = transform(nullptr);
        if (!replacement) {
            return std::unexpected(replacement.error());
        }
        if (!replacement->has_value()) {
            return node;
        }
        return node.withAppended(std::move(**replacement));
    }
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled path step"});
}

auto mutateAt(Value const& node,
              DeltaPath const& path,
              std::size_t depth,
              SlotTransform const& transform,
              MutateOptions const& options) -> Expected<Value> {
    if (depth + 1 == path.size()) {
        return applyTerminal(node, path, depth, transform, options);
    }
    auto const& step = path.steps()[depth];
    switch (step.kind) {
    case PathStep::Kind::Key: {
        if (!node.isObject()) {
            return std::unexpected(keyOnNonObject(path, depth, node));
        }
        auto const* child = node.find(step.name);
        if (!child) {
            return std::unexpected(Error{options.missingIntermediate, describeStep(path, depth) + " does not exist"});
        }
        auto updated = mutateAt(*child, path, depth + 1, transform, options);
        if (!updated) {
            return std::unexpected(updated.error());
        }
        return node.withMember(step.name, std::move(*updated));
    }
    case PathStep::Kind::Index: {
        auto const* child = node.at(step.position);
        if (!child) {
            return std::unexpected(indexError(path, depth, node));
        }
        auto updated = mutateAt(*child, path, depth + 1, transform, options);
        if (!updated) {
            return std::unexpected(updated.error());
        }
        return node.withElement(step.position, std::move(*updated));
    }
    case PathStep::Kind::Append:
        return std::unexpected(wildcardError(path, depth));
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled path step"});
}

} // namespace

auto resolve(Value const& tree, DeltaPath const& path) -> Expected<Value> {
    Value const* current = &tree;
    for (std::size_t depth = 0; depth < path.size(); ++depth) {
        auto const& step = path.steps()[depth];
        switch (step.kind) {
        case PathStep::Kind::Key: {
            if (!current->isObject()) {
                return std::unexpected(keyOnNonObject(path, depth, *current));
            }
            auto const* next = current->find(step.name);
            if (!next) {
                return std::unexpected(Error{Error::Code::MissingKey, describeStep(path, depth) + " does not exist"});
            }
            current = next;
            break;
        }
        case PathStep::Kind::Index: {
            auto const* next = current->at(step.position);
            if (!next) {
                return std::unexpected(indexError(path, depth, *current));
            }
            current = next;
            break;
        }
        case PathStep::Kind::Append:
            return std::unexpected(wildcardError(path, depth));
        }
    }
    return *current;
}

auto mutate(Value const& tree,
            DeltaPath const& path,
            SlotTransform const& transform,
            MutateOptions const& options) -> Expected<Value> {
    if (path.empty()) {
        auto replacement = transform(&tree);
        if (!replacement) {
            return std::unexpected(replacement.error());
        }
        if (!replacement->has_value()) {
            return std::unexpected(Error{Error::Code::InvalidPath, "the root cannot be removed"});
        }
        return std::move(**replacement);
    }
    return mutateAt(tree, path, 0, transform, options);
}

} // namespace TS::PathResolver
