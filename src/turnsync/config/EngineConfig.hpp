#pragma once

#include "core/Error.hpp"
#include "replay/SnapshotManager.hpp"
#include "session/Session.hpp"
#include "turn/TurnSequencer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <optional>

namespace TS {

/**
 * Engine policy. Defaults:
 *   snapshots.everyTurns       10
 *   snapshots.everyDeltas      0 (off)
 *   snapshots.retainSnapshots  4
 *   sequencer.lookaheadTurns   4
 *   sequencer.turnTimeoutMs    0 (off)
 *   session.idleEvictionMs     0 (off)
 *   storeRoot                  unset (sessions are not archived)
 *
 * Environment overrides: TURNSYNC_SNAPSHOT_EVERY_TURNS, TURNSYNC_SNAPSHOT_EVERY_DELTAS,
 * TURNSYNC_RETAIN_SNAPSHOTS, TURNSYNC_LOOKAHEAD_TURNS, TURNSYNC_TURN_TIMEOUT_MS,
 * TURNSYNC_IDLE_EVICTION_MS, TURNSYNC_STORE_ROOT.
 */
struct EngineConfig {
    SnapshotPolicy                       snapshots;
    SequencerOptions                     sequencer;
    SessionOptions                       session;
    std::optional<std::filesystem::path> storeRoot;
};

using EnvironmentLookup = std::function<char const*(char const* name)>;

[[nodiscard]] auto validateEngineConfig(EngineConfig const& config) -> Expected<void>;

// Members absent from `json` keep the values already in `base`.
[[nodiscard]] auto engineConfigFromJson(nlohmann::json const& json, EngineConfig base = {}) -> Expected<EngineConfig>;
[[nodiscard]] auto engineConfigToJson(EngineConfig const& config) -> nlohmann::json;

[[nodiscard]] auto loadEngineConfig(std::filesystem::path const& path) -> Expected<EngineConfig>;
[[nodiscard]] auto applyEnvironmentOverrides(EngineConfig config, EnvironmentLookup const& lookup = {})
        -> Expected<EngineConfig>;

} // namespace TS
