#include "config/EngineConfig.hpp"

#include "core/JsonFields.hpp"
#include "log/TaggedLogger.hpp"
#include "storage/FileIo.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <string>

namespace TS {

using namespace JsonFields;

namespace {

auto readCount(Json const& section, char const* key, std::size_t& out) -> Expected<void> {
    if (!section.contains(key)) {
        return {};
    }
    auto value = readUint64(section, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    out = static_cast<std::size_t>(*value);
    return {};
}

auto readMillis(Json const& section, char const* key, std::chrono::milliseconds& out) -> Expected<void> {
    if (!section.contains(key)) {
        return {};
    }
    auto value = readUint64(section, key);
    if (!value) {
        return std::unexpected(value.error());
    }
    out = std::chrono::milliseconds{static_cast<std::int64_t>(*value)};
    return {};
}

auto section(Json const& json, char const* key) -> Expected<Json const*> {
    auto it = json.find(key);
    if (it == json.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, key, "must be an object"));
    }
    return &*it;
}

auto parseUnsigned(char const* name, char const* raw) -> Expected<std::uint64_t> {
    std::uint64_t value = 0;
    auto const*   end   = raw + std::strlen(raw);
    auto [ptr, ec]      = std::from_chars(raw, end, value);
    if (ec != std::errc{} || ptr != end || raw == end) {
        return std::unexpected(makeError(Error::Code::MalformedInput, name, "must be a non-negative integer"));
    }
    return value;
}

} // namespace

auto validateEngineConfig(EngineConfig const& config) -> Expected<void> {
    return validatePolicy(config.snapshots);
}

auto engineConfigFromJson(nlohmann::json const& json, EngineConfig base) -> Expected<EngineConfig> {
    if (auto ok = ensureObject(json, "config"); !ok) {
        return std::unexpected(ok.error());
    }
    auto snapshots = section(json, "snapshots");
    if (!snapshots) {
        return std::unexpected(snapshots.error());
    }
    if (*snapshots) {
        for (auto [key, field] : {std::pair{"everyTurns", &base.snapshots.everyTurns},
                                  std::pair{"everyDeltas", &base.snapshots.everyDeltas},
                                  std::pair{"retainSnapshots", &base.snapshots.retainSnapshots}}) {
            if (auto ok = readCount(**snapshots, key, *field); !ok) {
                return std::unexpected(ok.error());
            }
        }
    }

    auto sequencer = section(json, "sequencer");
    if (!sequencer) {
        return std::unexpected(sequencer.error());
    }
    if (*sequencer) {
        if (auto ok = readCount(**sequencer, "lookaheadTurns", base.sequencer.lookaheadTurns); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = readMillis(**sequencer, "turnTimeoutMs", base.sequencer.turnTimeout); !ok) {
            return std::unexpected(ok.error());
        }
    }

    auto session = section(json, "session");
    if (!session) {
        return std::unexpected(session.error());
    }
    if (*session) {
        if (auto ok = readMillis(**session, "idleEvictionMs", base.session.idleEviction); !ok) {
            return std::unexpected(ok.error());
        }
    }

    auto storeRoot = readOptionalString(json, "storeRoot");
    if (!storeRoot) {
        return std::unexpected(storeRoot.error());
    }
    if (*storeRoot) {
        base.storeRoot = std::filesystem::path(**storeRoot);
    }

    if (auto valid = validateEngineConfig(base); !valid) {
        return std::unexpected(valid.error());
    }
    return base;
}

auto engineConfigToJson(EngineConfig const& config) -> nlohmann::json {
    Json json{
            {"snapshots",
             {{"everyTurns", config.snapshots.everyTurns},
              {"everyDeltas", config.snapshots.everyDeltas},
              {"retainSnapshots", config.snapshots.retainSnapshots}}},
            {"sequencer",
             {{"lookaheadTurns", config.sequencer.lookaheadTurns},
              {"turnTimeoutMs", config.sequencer.turnTimeout.count()}}},
            {"session", {{"idleEvictionMs", config.session.idleEviction.count()}}},
    };
    if (config.storeRoot) {
        json["storeRoot"] = config.storeRoot->string();
    }
    return json;
}

auto loadEngineConfig(std::filesystem::path const& path) -> Expected<EngineConfig> {
    auto text = FileIo::readTextFile(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto json = parseDocument(*text, path.filename().string());
    if (!json) {
        return std::unexpected(json.error());
    }
    ts_log("Loaded engine config from " + path.string(), "Config");
    return engineConfigFromJson(*json);
}

auto applyEnvironmentOverrides(EngineConfig config, EnvironmentLookup const& lookup) -> Expected<EngineConfig> {
    auto get = [&lookup](char const* name) -> char const* { return lookup ? lookup(name) : std::getenv(name); };

    auto count = [&](char const* name, std::size_t& out) -> Expected<void> {
        if (auto const* raw = get(name)) {
            auto value = parseUnsigned(name, raw);
            if (!value) {
                return std::unexpected(value.error());
            }
            out = static_cast<std::size_t>(*value);
        }
        return {};
    };
    auto millis = [&](char const* name, std::chrono::milliseconds& out) -> Expected<void> {
        std::size_t value = static_cast<std::size_t>(out.count());
        if (auto ok = count(name, value); !ok) {
            return ok;
        }
        out = std::chrono::milliseconds{static_cast<std::int64_t>(value)};
        return {};
    };

    for (auto [name, field] : {std::pair{"TURNSYNC_SNAPSHOT_EVERY_TURNS", &config.snapshots.everyTurns},
                               std::pair{"TURNSYNC_SNAPSHOT_EVERY_DELTAS", &config.snapshots.everyDeltas},
                               std::pair{"TURNSYNC_RETAIN_SNAPSHOTS", &config.snapshots.retainSnapshots},
                               std::pair{"TURNSYNC_LOOKAHEAD_TURNS", &config.sequencer.lookaheadTurns}}) {
        if (auto ok = count(name, *field); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (auto ok = millis("TURNSYNC_TURN_TIMEOUT_MS", config.sequencer.turnTimeout); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = millis("TURNSYNC_IDLE_EVICTION_MS", config.session.idleEviction); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto const* root = get("TURNSYNC_STORE_ROOT"); root && *root) {
        config.storeRoot = std::filesystem::path(root);
    }

    if (auto valid = validateEngineConfig(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

} // namespace TS
