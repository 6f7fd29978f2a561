#pragma once

#include "core/Error.hpp"
#include "core/Value.hpp"
#include "path/DeltaPath.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

enum class DeltaOp {
    Set,
    Delete,
    Push,
    Pull,
    Increment,
};

enum class DeltaSource {
    PlayerAction,
    GmNarration,
    NpcAction,
    ConflictResolution,
    TimePassage,
    System,
};

[[nodiscard]] auto deltaOpToString(DeltaOp op) -> std::string_view;
[[nodiscard]] auto parseDeltaOp(std::string_view name) -> Expected<DeltaOp>;
[[nodiscard]] auto deltaSourceToString(DeltaSource source) -> std::string_view;
[[nodiscard]] auto parseDeltaSource(std::string_view name) -> Expected<DeltaSource>;

// Members of the session state root that targets map onto.
namespace StateRoots {
inline constexpr std::string_view World  = "world";
inline constexpr std::string_view Player = "player";
inline constexpr std::string_view Npcs   = "npcs";
inline constexpr std::string_view Scene  = "currentScene";
} // namespace StateRoots

// Sub-root a delta addresses: "world", "player", "npc:<id>" or "scene".
struct Target {
    enum class Kind {
        World,
        Player,
        Npc,
        Scene,
    };

    Kind        kind = Kind::World;
    std::string npcId;

    [[nodiscard]] auto rootPath() const -> DeltaPath;
    [[nodiscard]] auto toString() const -> std::string;
};

[[nodiscard]] auto parseTarget(std::string_view text) -> Expected<Target>;

struct Delta {
    std::string                id;
    std::uint64_t              turn      = 0;
    std::string                timestamp;
    DeltaSource                source    = DeltaSource::System;
    std::string                target;
    std::string                path;
    DeltaOp                    op        = DeltaOp::Set;
    Value                      value;
    // Value at `path` before the delta was applied; std::nullopt when the slot was
    // absent (fresh key, push). Only the applicator records it.
    std::optional<Value>       previousValue;
    std::optional<std::string> description;

    friend auto operator==(Delta const&, Delta const&) -> bool = default;
};

struct TurnDeltas {
    std::uint64_t              turn = 0;
    std::vector<Delta>         deltas;
    std::optional<std::string> checksum;
};

} // namespace TS
