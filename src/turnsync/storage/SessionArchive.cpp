#include "storage/SessionArchive.hpp"

#include "core/JsonFields.hpp"
#include "core/ValueJson.hpp"

namespace TS {

using namespace JsonFields;

namespace {

auto counter(Json const& stats, char const* key) -> std::uint64_t {
    auto value = readUint64(stats, key);
    return value ? *value : 0;
}

} // namespace

auto summarize(SessionMetadata const& metadata) -> SessionSummary {
    return SessionSummary{metadata.id, metadata.name, metadata.themeName, metadata.currentTurn, metadata.updatedAt};
}

auto archiveFromHistory(SessionMetadata metadata, History const& history) -> SessionArchive {
    SessionArchive archive;
    archive.metadata             = std::move(metadata);
    archive.metadata.currentTurn = history.headTurn;
    archive.snapshots.assign(history.snapshots.begin(), history.snapshots.end());
    archive.log.assign(history.log.begin(), history.log.end());
    return archive;
}

auto metadataToJson(SessionMetadata const& metadata) -> nlohmann::json {
    return Json{
        {"id", metadata.id},
        {"name", metadata.name},
        {"theme", {{"name", metadata.themeName}, {"version", std::string(kArchiveFormatVersion)}}},
        {"player", {{"name", metadata.playerName}}},
        {"currentTurn", metadata.currentTurn},
        {"createdAt", metadata.createdAt},
        {"updatedAt", metadata.updatedAt},
        {"lastPlayedAt", metadata.updatedAt},
        {"version", std::string(kArchiveFormatVersion)},
        {"stats",
         {{"totalTurns", metadata.stats.totalTurns},
          {"totalDeltas", metadata.stats.totalDeltas},
          {"totalSnapshots", metadata.stats.totalSnapshots},
          {"rejectedDeltas", metadata.stats.rejectedDeltas}}},
    };
}

auto metadataFromJson(nlohmann::json const& json) -> Expected<SessionMetadata> {
    if (auto ok = ensureObject(json, "session.meta"); !ok) {
        return std::unexpected(ok.error());
    }
    SessionMetadata metadata;
    auto id = readUuid(json, "id");
    if (!id) {
        return std::unexpected(id.error());
    }
    metadata.id = std::move(*id);

    auto name = readString(json, "name");
    if (!name) {
        return std::unexpected(name.error());
    }
    metadata.name = std::move(*name);

    auto theme = json.find("theme");
    if (theme == json.end() || !theme->is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, "theme", "must be an object"));
    }
    auto themeName = readString(*theme, "name");
    if (!themeName) {
        return std::unexpected(themeName.error());
    }
    metadata.themeName = std::move(*themeName);

    auto player = json.find("player");
    if (player == json.end() || !player->is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, "player", "must be an object"));
    }
    auto playerName = readString(*player, "name");
    if (!playerName) {
        return std::unexpected(playerName.error());
    }
    metadata.playerName = std::move(*playerName);

    auto turn = readUint64(json, "currentTurn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    metadata.currentTurn = *turn;

    auto createdAt = readString(json, "createdAt");
    if (!createdAt) {
        return std::unexpected(createdAt.error());
    }
    metadata.createdAt = std::move(*createdAt);
    auto updatedAt = readString(json, "updatedAt");
    if (!updatedAt) {
        return std::unexpected(updatedAt.error());
    }
    metadata.updatedAt = std::move(*updatedAt);

    // Archives written before stats existed load with zeroed counters.
    if (auto stats = json.find("stats"); stats != json.end() && stats->is_object()) {
        metadata.stats.totalTurns     = counter(*stats, "totalTurns");
        metadata.stats.totalDeltas    = counter(*stats, "totalDeltas");
        metadata.stats.totalSnapshots = counter(*stats, "totalSnapshots");
        metadata.stats.rejectedDeltas = counter(*stats, "rejectedDeltas");
    }
    return metadata;
}

auto snapshotToJson(Snapshot const& snapshot) -> nlohmann::json {
    return Json{{"turn", snapshot.turn}, {"state", toJson(snapshot.state)}};
}

auto snapshotFromJson(nlohmann::json const& json) -> Expected<Snapshot> {
    if (auto ok = ensureObject(json, "snapshot"); !ok) {
        return std::unexpected(ok.error());
    }
    auto turn = readUint64(json, "turn");
    if (!turn) {
        return std::unexpected(turn.error());
    }
    auto state = json.find("state");
    if (state == json.end() || !state->is_object()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, "state", "must be an object"));
    }
    return Snapshot{*turn, fromJson(*state)};
}

} // namespace TS
