#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace TS {

/**
 * Dynamically typed state tree node.
 *
 * Containers are held through shared pointers to const storage. A Value is never
 * modified after construction; the `with*` helpers return a fresh Value whose
 * container is a shallow copy, so every child that was not replaced is shared with
 * the original. Copying a Value is cheap and older trees stay valid for replay and
 * rollback.
 */
class Value {
public:
    enum class Kind : std::uint8_t {
        Null,
        Boolean,
        Integer,
        Double,
        String,
        Array,
        Object,
    };

    using Array     = std::vector<Value>;
    using Object    = std::map<std::string, Value, std::less<>>;
    using ArrayPtr  = std::shared_ptr<const Array>;
    using ObjectPtr = std::shared_ptr<const Object>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : storage(value) {}
    Value(double value) : storage(value) {}
    Value(std::string value) : storage(std::move(value)) {}
    Value(std::string_view value) : storage(std::string(value)) {}
    Value(char const* value) : storage(std::string(value)) {}

    template <typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T value) : storage(static_cast<std::int64_t>(value)) {}

    [[nodiscard]] static auto array(Array items = {}) -> Value;
    [[nodiscard]] static auto object(Object members = {}) -> Value;

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(storage.index()); }

    [[nodiscard]] auto isNull() const noexcept -> bool { return kind() == Kind::Null; }
    [[nodiscard]] auto isBool() const noexcept -> bool { return kind() == Kind::Boolean; }
    [[nodiscard]] auto isInteger() const noexcept -> bool { return kind() == Kind::Integer; }
    [[nodiscard]] auto isDouble() const noexcept -> bool { return kind() == Kind::Double; }
    [[nodiscard]] auto isNumber() const noexcept -> bool { return isInteger() || isDouble(); }
    [[nodiscard]] auto isString() const noexcept -> bool { return kind() == Kind::String; }
    [[nodiscard]] auto isArray() const noexcept -> bool { return kind() == Kind::Array; }
    [[nodiscard]] auto isObject() const noexcept -> bool { return kind() == Kind::Object; }

    [[nodiscard]] auto asBool() const -> bool { return std::get<bool>(storage); }
    [[nodiscard]] auto asInteger() const -> std::int64_t { return std::get<std::int64_t>(storage); }
    // Numeric value of an Integer or Double.
    [[nodiscard]] auto asDouble() const -> double;
    [[nodiscard]] auto asString() const -> std::string const& { return std::get<std::string>(storage); }
    [[nodiscard]] auto asArray() const -> Array const&;
    [[nodiscard]] auto asObject() const -> Object const&;

    // Element count of a container, 0 for scalars.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto find(std::string_view key) const -> Value const*;
    [[nodiscard]] auto at(std::size_t index) const -> Value const*;

    [[nodiscard]] auto withMember(std::string key, Value value) const -> Value;
    [[nodiscard]] auto withoutMember(std::string_view key) const -> Value;
    [[nodiscard]] auto withElement(std::size_t index, Value value) const -> Value;
    [[nodiscard]] auto withInserted(std::size_t index, Value value) const -> Value;
    [[nodiscard]] auto withoutElement(std::size_t index) const -> Value;
    [[nodiscard]] auto withAppended(Value value) const -> Value;

    // True when both values refer to the very same container storage.
    [[nodiscard]] auto sharesStorageWith(Value const& other) const noexcept -> bool;

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, ArrayPtr, ObjectPtr> storage;
};

[[nodiscard]] auto kindToString(Value::Kind kind) -> std::string_view;

} // namespace TS
