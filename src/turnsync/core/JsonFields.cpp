#include "core/JsonFields.hpp"

#include "core/Identifiers.hpp"

namespace TS::JsonFields {

auto makeError(Error::Code code, std::string_view field, std::string_view detail) -> Error {
    std::string message;
    message.reserve(field.size() + detail.size() + 2);
    message.append(field);
    if (!detail.empty()) {
        message.append(": ");
        message.append(detail);
    }
    return Error{code, std::move(message)};
}

auto ensureObject(Json const& json, std::string_view context) -> Expected<void> {
    if (!json.is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, context, "must be a JSON object"));
    }
    return {};
}

auto readString(Json const& json, char const* key) -> Expected<std::string> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_string()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be a string"));
        }
        return it->get<std::string>();
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto readOptionalString(Json const& json, char const* key) -> Expected<std::optional<std::string>> {
    if (auto it = json.find(key); it != json.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be a string"));
        }
        return std::optional<std::string>{it->get<std::string>()};
    }
    return std::optional<std::string>{std::nullopt};
}

auto readUuid(Json const& json, char const* key) -> Expected<std::string> {
    auto value = readString(json, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (!isUuid(*value)) {
        return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be a UUID"));
    }
    return value;
}

auto readBoolean(Json const& json, char const* key) -> Expected<bool> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be a bool"));
        }
        return it->get<bool>();
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto readUint64(Json const& json, char const* key) -> Expected<std::uint64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_unsigned()) {
            return it->get<std::uint64_t>();
        }
        if (it->is_number_integer()) {
            auto value = it->get<std::int64_t>();
            if (value < 0) {
                return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be non-negative"));
            }
            return static_cast<std::uint64_t>(value);
        }
        return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto readInt64(Json const& json, char const* key) -> Expected<std::int64_t> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number_integer()) {
            return it->get<std::int64_t>();
        }
        return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be an integer"));
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto readNumber(Json const& json, char const* key) -> Expected<double> {
    if (auto it = json.find(key); it != json.end()) {
        if (it->is_number()) {
            return it->get<double>();
        }
        return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be a number"));
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto readStringArray(Json const& json, char const* key) -> Expected<std::vector<std::string>> {
    auto array = readArray(json, key);
    if (!array) {
        return std::unexpected(array.error());
    }
    std::vector<std::string> values;
    values.reserve((*array)->size());
    for (auto const& item : **array) {
        if (!item.is_string()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, key, "entries must be strings"));
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

auto readArray(Json const& json, char const* key) -> Expected<Json const*> {
    if (auto it = json.find(key); it != json.end()) {
        if (!it->is_array()) {
            return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be an array"));
        }
        return &*it;
    }
    return std::unexpected(makeError(Error::Code::MalformedInput, key, "is required"));
}

auto parseDocument(std::string_view text, std::string_view context) -> Expected<Json> {
    auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, context, "invalid JSON payload"));
    }
    if (!json.is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, context, "must be a JSON object"));
    }
    return json;
}

auto writeDocument(Json const& json, int indent) -> std::string {
    return json.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace TS::JsonFields
