#include "delta/Delta.hpp"

namespace TS {

namespace {

constexpr std::string_view kNpcPrefix = "npc:";

} // namespace

auto deltaOpToString(DeltaOp op) -> std::string_view {
    switch (op) {
    case DeltaOp::Set:
        return "set";
    case DeltaOp::Delete:
        return "delete";
    case DeltaOp::Push:
        return "push";
    case DeltaOp::Pull:
        return "pull";
    case DeltaOp::Increment:
        return "increment";
    }
    return "set";
}

auto parseDeltaOp(std::string_view name) -> Expected<DeltaOp> {
    if (name == "set") {
        return DeltaOp::Set;
    }
    if (name == "delete") {
        return DeltaOp::Delete;
    }
    if (name == "push") {
        return DeltaOp::Push;
    }
    if (name == "pull") {
        return DeltaOp::Pull;
    }
    if (name == "increment") {
        return DeltaOp::Increment;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "op: unknown operation '" + std::string(name) + "'"});
}

auto deltaSourceToString(DeltaSource source) -> std::string_view {
    switch (source) {
    case DeltaSource::PlayerAction:
        return "player_action";
    case DeltaSource::GmNarration:
        return "gm_narration";
    case DeltaSource::NpcAction:
        return "npc_action";
    case DeltaSource::ConflictResolution:
        return "conflict_resolution";
    case DeltaSource::TimePassage:
        return "time_passage";
    case DeltaSource::System:
        return "system";
    }
    return "system";
}

auto parseDeltaSource(std::string_view name) -> Expected<DeltaSource> {
    if (name == "player_action") {
        return DeltaSource::PlayerAction;
    }
    if (name == "gm_narration") {
        return DeltaSource::GmNarration;
    }
    if (name == "npc_action") {
        return DeltaSource::NpcAction;
    }
    if (name == "conflict_resolution") {
        return DeltaSource::ConflictResolution;
    }
    if (name == "time_passage") {
        return DeltaSource::TimePassage;
    }
    if (name == "system") {
        return DeltaSource::System;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "source: unknown source '" + std::string(name) + "'"});
}

auto Target::rootPath() const -> DeltaPath {
    switch (kind) {
    case Kind::World:
        return DeltaPath{std::vector<PathStep>{PathStep::key(std::string(StateRoots::World))}};
    case Kind::Player:
        return DeltaPath{std::vector<PathStep>{PathStep::key(std::string(StateRoots::Player))}};
    case Kind::Npc:
        return DeltaPath{std::vector<PathStep>{PathStep::key(std::string(StateRoots::Npcs)), PathStep::key(npcId)}};
    case Kind::Scene:
        return DeltaPath{std::vector<PathStep>{PathStep::key(std::string(StateRoots::Scene))}};
    }
    return {};
}

auto Target::toString() const -> std::string {
    switch (kind) {
    case Kind::World:
        return "world";
    case Kind::Player:
        return "player";
    case Kind::Npc:
        return std::string(kNpcPrefix) + npcId;
    case Kind::Scene:
        return "scene";
    }
    return {};
}

auto parseTarget(std::string_view text) -> Expected<Target> {
    if (text == "world") {
        return Target{Target::Kind::World, {}};
    }
    if (text == "player") {
        return Target{Target::Kind::Player, {}};
    }
    if (text == "scene") {
        return Target{Target::Kind::Scene, {}};
    }
    if (text.starts_with(kNpcPrefix)) {
        auto id = text.substr(kNpcPrefix.size());
        if (id.empty()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "target: npc id must not be empty"});
        }
        return Target{Target::Kind::Npc, std::string(id)};
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "target: unknown target '" + std::string(text) + "'"});
}

} // namespace TS
