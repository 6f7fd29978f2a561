#include "core/ValueJson.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace TS {

auto toJson(Value const& value) -> nlohmann::json {
    switch (value.kind()) {
    case Value::Kind::Null:
        return nullptr;
    case Value::Kind::Boolean:
        return value.asBool();
    case Value::Kind::Integer:
        return value.asInteger();
    case Value::Kind::Double:
        if (!std::isfinite(value.asDouble())) {
            return nullptr;
        }
        return value.asDouble();
    case Value::Kind::String:
        return value.asString();
    case Value::Kind::Array: {
        auto json = nlohmann::json::array();
        for (auto const& item : value.asArray()) {
            json.push_back(toJson(item));
        }
        return json;
    }
    case Value::Kind::Object: {
        auto json = nlohmann::json::object();
        for (auto const& [key, member] : value.asObject()) {
            json[key] = toJson(member);
        }
        return json;
    }
    }
    return nullptr;
}

auto fromJson(nlohmann::json const& json) -> Value {
    switch (json.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        return Value{};
    case nlohmann::json::value_t::boolean:
        return Value{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
        return Value{json.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned: {
        auto const raw = json.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value{static_cast<double>(raw)};
        }
        return Value{static_cast<std::int64_t>(raw)};
    }
    case nlohmann::json::value_t::number_float:
        return Value{json.get<double>()};
    case nlohmann::json::value_t::string:
        return Value{json.get<std::string>()};
    case nlohmann::json::value_t::array: {
        Value::Array items;
        items.reserve(json.size());
        for (auto const& item : json) {
            items.push_back(fromJson(item));
        }
        return Value::array(std::move(items));
    }
    case nlohmann::json::value_t::object: {
        Value::Object members;
        for (auto it = json.begin(); it != json.end(); ++it) {
            members.emplace(it.key(), fromJson(it.value()));
        }
        return Value::object(std::move(members));
    }
    case nlohmann::json::value_t::binary:
        break;
    }
    return Value{};
}

auto canonicalJson(Value const& value) -> std::string {
    // nlohmann::json keeps object members in a std::map, so dump() is key-ordered.
    // Bytes that are not UTF-8 become U+FFFD instead of throwing; deltas carrying them
    // are rejected before they reach the state.
    return toJson(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto parseValue(std::string_view text) -> Expected<Value> {
    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "invalid JSON document"});
    }
    return fromJson(json);
}

auto isValidUtf8(std::string_view text) -> bool {
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto const lead = static_cast<unsigned char>(text[pos]);
        if (lead < 0x80) {
            ++pos;
            continue;
        }
        std::size_t   length = 0;
        std::uint32_t code   = 0;
        std::uint32_t lowest = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code   = lead & 0x1F;
            lowest = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code   = lead & 0x0F;
            lowest = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code   = lead & 0x07;
            lowest = 0x10000;
        } else {
            return false;
        }
        if (pos + length > text.size()) {
            return false;
        }
        for (std::size_t i = 1; i < length; ++i) {
            auto const next = static_cast<unsigned char>(text[pos + i]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (next & 0x3F);
        }
        if (code < lowest || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        pos += length;
    }
    return true;
}

auto holdsInvalidUtf8(Value const& value) -> bool {
    switch (value.kind()) {
    case Value::Kind::String:
        return !isValidUtf8(value.asString());
    case Value::Kind::Array:
        for (auto const& item : value.asArray()) {
            if (holdsInvalidUtf8(item)) {
                return true;
            }
        }
        return false;
    case Value::Kind::Object:
        for (auto const& [key, member] : value.asObject()) {
            if (!isValidUtf8(key) || holdsInvalidUtf8(member)) {
                return true;
            }
        }
        return false;
    default:
        return false;
    }
}

} // namespace TS
