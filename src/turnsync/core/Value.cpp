#include "core/Value.hpp"

#include <iterator>
#include <stdexcept>

namespace TS {

namespace {

auto emptyArray() -> Value::Array const& {
    static Value::Array const instance;
    return instance;
}

auto emptyObject() -> Value::Object const& {
    static Value::Object const instance;
    return instance;
}

} // namespace

auto Value::array(Array items) -> Value {
    Value value;
    value.storage = std::make_shared<const Array>(std::move(items));
    return value;
}

auto Value::object(Object members) -> Value {
    Value value;
    value.storage = std::make_shared<const Object>(std::move(members));
    return value;
}

auto Value::asDouble() const -> double {
    if (auto const* integer = std::get_if<std::int64_t>(&storage)) {
        return static_cast<double>(*integer);
    }
    return std::get<double>(storage);
}

auto Value::asArray() const -> Array const& {
    auto const& ptr = std::get<ArrayPtr>(storage);
    return ptr ? *ptr : emptyArray();
}

auto Value::asObject() const -> Object const& {
    auto const& ptr = std::get<ObjectPtr>(storage);
    return ptr ? *ptr : emptyObject();
}

auto Value::size() const noexcept -> std::size_t {
    switch (kind()) {
    case Kind::Array:
        return asArray().size();
    case Kind::Object:
        return asObject().size();
    default:
        return 0;
    }
}

auto Value::find(std::string_view key) const -> Value const* {
    if (!isObject()) {
        return nullptr;
    }
    auto const& members = asObject();
    auto        it      = members.find(key);
    return it == members.end() ? nullptr : &it->second;
}

auto Value::at(std::size_t index) const -> Value const* {
    if (!isArray()) {
        return nullptr;
    }
    auto const& items = asArray();
    return index < items.size() ? &items[index] : nullptr;
}

auto Value::withMember(std::string key, Value value) const -> Value {
    if (!isObject()) {
        throw std::logic_error("withMember on non-object value");
    }
    Object members = asObject();
    members.insert_or_assign(std::move(key), std::move(value));
    return object(std::move(members));
}

auto Value::withoutMember(std::string_view key) const -> Value {
    if (!isObject()) {
        throw std::logic_error("withoutMember on non-object value");
    }
    Object members = asObject();
    if (auto it = members.find(key); it != members.end()) {
        members.erase(it);
    }
    return object(std::move(members));
}

auto Value::withElement(std::size_t index, Value value) const -> Value {
    if (!isArray() || index >= size()) {
        throw std::out_of_range("withElement index out of range");
    }
    Array items = asArray();
    items[index] = std::move(value);
    return array(std::move(items));
}

auto Value::withInserted(std::size_t index, Value value) const -> Value {
    if (!isArray() || index > size()) {
        throw std::out_of_range("withInserted index out of range");
    }
    Array items = asArray();
    items.insert(std::next(items.begin(), static_cast<std::ptrdiff_t>(index)), std::move(value));
    return array(std::move(items));
}

auto Value::withoutElement(std::size_t index) const -> Value {
    if (!isArray() || index >= size()) {
        throw std::out_of_range("withoutElement index out of range");
    }
    Array items = asArray();
    items.erase(std::next(items.begin(), static_cast<std::ptrdiff_t>(index)));
    return array(std::move(items));
}

auto Value::withAppended(Value value) const -> Value {
    if (!isArray()) {
        throw std::logic_error("withAppended on non-array value");
    }
    Array items = asArray();
    items.push_back(std::move(value));
    return array(std::move(items));
}

auto Value::sharesStorageWith(Value const& other) const noexcept -> bool {
    if (kind() != other.kind()) {
        return false;
    }
    if (auto const* lhs = std::get_if<ArrayPtr>(&storage)) {
        return lhs->get() == std::get<ArrayPtr>(other.storage).get();
    }
    if (auto const* lhs = std::get_if<ObjectPtr>(&storage)) {
        return lhs->get() == std::get<ObjectPtr>(other.storage).get();
    }
    return false;
}

auto operator==(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isInteger() && rhs.isInteger()) {
            return lhs.asInteger() == rhs.asInteger();
        }
        return lhs.asDouble() == rhs.asDouble();
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
    case Value::Kind::Null:
        return true;
    case Value::Kind::Boolean:
        return lhs.asBool() == rhs.asBool();
    case Value::Kind::String:
        return lhs.asString() == rhs.asString();
    case Value::Kind::Array:
        return lhs.sharesStorageWith(rhs) || lhs.asArray() == rhs.asArray();
    case Value::Kind::Object:
        return lhs.sharesStorageWith(rhs) || lhs.asObject() == rhs.asObject();
    case Value::Kind::Integer:
    case Value::Kind::Double:
        break;
    }
    return false;
}

auto kindToString(Value::Kind kind) -> std::string_view {
    switch (kind) {
    case Value::Kind::Null:
        return "null";
    case Value::Kind::Boolean:
        return "boolean";
    case Value::Kind::Integer:
        return "integer";
    case Value::Kind::Double:
        return "double";
    case Value::Kind::String:
        return "string";
    case Value::Kind::Array:
        return "array";
    case Value::Kind::Object:
        return "object";
    }
    return "unknown";
}

} // namespace TS
