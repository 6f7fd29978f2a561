#pragma once

#include "core/Error.hpp"
#include "delta/Delta.hpp"
#include "replay/SnapshotManager.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace TS {

struct SessionStats {
    std::uint64_t totalTurns     = 0;
    std::uint64_t totalDeltas    = 0;
    std::uint64_t totalSnapshots = 0;
    std::uint64_t rejectedDeltas = 0;
};

struct SessionMetadata {
    std::string   id;
    std::string   name;
    std::string   themeName;
    std::string   playerName;
    std::uint64_t currentTurn = 0;
    std::string   createdAt;
    std::string   updatedAt;
    SessionStats  stats;
};

// One row of a SESSION_LIST reply.
struct SessionSummary {
    std::string   id;
    std::string   name;
    std::string   theme;
    std::uint64_t turn = 0;
    std::string   lastPlayed;
};

// Everything needed to resume a session: retained snapshots and the log after the
// oldest of them.
struct SessionArchive {
    SessionMetadata         metadata;
    std::vector<Snapshot>   snapshots;
    std::vector<TurnDeltas> log;
};

inline constexpr std::string_view kArchiveFormatVersion = "1";

[[nodiscard]] auto summarize(SessionMetadata const& metadata) -> SessionSummary;
[[nodiscard]] auto archiveFromHistory(SessionMetadata metadata, History const& history) -> SessionArchive;

[[nodiscard]] auto metadataToJson(SessionMetadata const& metadata) -> nlohmann::json;
[[nodiscard]] auto metadataFromJson(nlohmann::json const& json) -> Expected<SessionMetadata>;
[[nodiscard]] auto snapshotToJson(Snapshot const& snapshot) -> nlohmann::json;
[[nodiscard]] auto snapshotFromJson(nlohmann::json const& json) -> Expected<Snapshot>;

} // namespace TS
