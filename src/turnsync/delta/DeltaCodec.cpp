#include "delta/DeltaCodec.hpp"

#include "core/JsonFields.hpp"
#include "core/ValueJson.hpp"

namespace TS {

using namespace JsonFields;

auto deltaToJson(Delta const& delta) -> nlohmann::json {
    Json json{
        {"id", delta.id},
        {"turn", delta.turn},
        {"timestamp", delta.timestamp},
        {"source", std::string(deltaSourceToString(delta.source))},
        {"target", delta.target},
        {"path", delta.path},
        {"op", std::string(deltaOpToString(delta.op))},
        {"value", toJson(delta.value)},
    };
    if (delta.previousValue) {
        json["previousValue"] = toJson(*delta.previousValue);
    }
    if (delta.description) {
        json["description"] = *delta.description;
    }
    return json;
}

auto deltaFromJson(nlohmann::json const& json) -> Expected<Delta> {
    if (auto ok = ensureObject(json, "delta"); !ok) {
        return std::unexpected(ok.error());
    }
    Delta delta;
    auto id = readUuid(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    delta.id = std::move(*id);

    auto turn = readUint64(json, "turn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    delta.turn = *turn;

    auto timestamp = readString(json, "timestamp");
    if (!timestamp) {
        return std::unexpected(timestamp.error());
    }
    delta.timestamp = std::move(*timestamp);

    auto sourceName = readString(json, "source");
    if (!sourceName) {
        return std::unexpected(sourceName.error());
    }
    auto source = parseDeltaSource(*sourceName);
    if (!source) {
        return std::unexpected(source.error());
    }
    delta.source = *source;

    auto target = readString(json, "target");
    if (!target) {
        return std::unexpected(target.error());
    }
    delta.target = std::move(*target);

    auto path = readString(json, "path");
    if (!path) {
        return std::unexpected(path.error());
    }
    delta.path = std::move(*path);

    auto opName = readString(json, "op");
    if (!opName) {
        return std::unexpected(opName.error());
    }
    auto op = parseDeltaOp(*opName);
    if (!op) {
        return std::unexpected(op.error());
    }
    delta.op = *op;

    // delete carries no payload on the wire; every other op needs one.
    if (auto it = json.find("value"); it != json.end()) {
        delta.value = fromJson(*it);
    } else if (delta.op != DeltaOp::Delete) {
        return std::unexpected(makeError(Error::Code::MalformedInput, "value", "is required"));
    }
    if (auto it = json.find("previousValue"); it != json.end()) {
        delta.previousValue = fromJson(*it);
    }

    auto description = readOptionalString(json, "description");
    if (!description) {
        return std::unexpected(description.error());
    }
    delta.description = std::move(*description);
    return delta;
}

auto turnDeltasToJson(TurnDeltas const& batch) -> nlohmann::json {
    Json deltas = Json::array();
    for (auto const& delta : batch.deltas) {
        deltas.push_back(deltaToJson(delta));
    }
    Json json{{"turn", batch.turn}, {"deltas", std::move(deltas)}};
    if (batch.checksum) {
        json["checksum"] = *batch.checksum;
    }
    return json;
}

auto turnDeltasFromJson(nlohmann::json const& json) -> Expected<TurnDeltas> {
    if (auto ok = ensureObject(json, "turnDeltas"); !ok) {
        return std::unexpected(ok.error());
    }
    TurnDeltas batch;
    auto turn = readUint64(json, "turn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    batch.turn = *turn;

    auto entries = readArray(json, "deltas");
    if (!entries) {
        return std::unexpected(entries.error());
    }
    batch.deltas.reserve((*entries)->size());
    for (auto const& entry : **entries) {
        auto delta = deltaFromJson(entry);
        if (!delta) {
            return std::unexpected(delta.error());
        }
        if (delta->turn != batch.turn) {
            return std::unexpected(makeError(Error::Code::MalformedInput,
                                             "deltas",
                                             "delta " + delta->id + " belongs to turn "
                                                 + std::to_string(delta->turn)));
        }
        batch.deltas.push_back(std::move(*delta));
    }

    auto checksum = readOptionalString(json, "checksum");
    if (!checksum) {
        return std::unexpected(checksum.error());
    }
    batch.checksum = std::move(*checksum);
    return batch;
}

auto serializeDelta(Delta const& delta) -> std::string {
    return JsonFields::writeDocument(deltaToJson(delta));
}

auto deserializeDelta(std::string_view payload) -> Expected<Delta> {
    auto json = parseDocument(payload, "delta");
    if (!json) {
        return std::unexpected(json.error());
    }
    return deltaFromJson(*json);
}

auto serializeTurnDeltas(TurnDeltas const& batch) -> std::string {
    return JsonFields::writeDocument(turnDeltasToJson(batch));
}

auto deserializeTurnDeltas(std::string_view payload) -> Expected<TurnDeltas> {
    auto json = parseDocument(payload, "turnDeltas");
    if (!json) {
        return std::unexpected(json.error());
    }
    return turnDeltasFromJson(*json);
}

} // namespace TS
