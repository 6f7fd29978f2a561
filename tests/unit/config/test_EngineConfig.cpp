#include "config/EngineConfig.hpp"
#include "storage/FileIo.hpp"

#include "TurnSyncTestHelpers.hpp"

#include <nlohmann/json.hpp>

#include <map>

using namespace TS;
using TS::Testing::TempDirectory;

namespace {

auto lookupFrom(std::map<std::string, std::string> vars) -> EnvironmentLookup {
    return [vars = std::move(vars)](char const* name) -> char const* {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST_SUITE("EngineConfig") {
    TEST_CASE("defaults are valid") {
        EngineConfig config;
        CHECK(validateEngineConfig(config).has_value());
        CHECK(config.snapshots.everyTurns == 10);
        CHECK(config.snapshots.retainSnapshots == 4);
        CHECK(config.sequencer.lookaheadTurns == 4);
        CHECK(config.sequencer.turnTimeout.count() == 0);
        CHECK_FALSE(config.storeRoot.has_value());
    }

    TEST_CASE("json overrides only the members it names") {
        auto json = nlohmann::json::parse(R"({"snapshots": {"everyTurns": 5}, "sequencer": {"turnTimeoutMs": 2500},
                                              "storeRoot": "/var/lib/turnsync"})");
        auto config = engineConfigFromJson(json);
        REQUIRE(config.has_value());
        CHECK(config->snapshots.everyTurns == 5);
        CHECK(config->snapshots.retainSnapshots == 4);
        CHECK(config->sequencer.turnTimeout == std::chrono::milliseconds{2500});
        CHECK(config->sequencer.lookaheadTurns == 4);
        REQUIRE(config->storeRoot.has_value());
        CHECK(config->storeRoot->string() == "/var/lib/turnsync");

        auto again = engineConfigFromJson(engineConfigToJson(*config));
        REQUIRE(again.has_value());
        CHECK(again->snapshots.everyTurns == 5);
        CHECK(again->sequencer.turnTimeout == std::chrono::milliseconds{2500});
    }

    TEST_CASE("invalid json values are malformed input") {
        for (auto text : {R"({"snapshots": {"everyTurns": 0}})",
                          R"({"snapshots": {"retainSnapshots": 0}})",
                          R"({"snapshots": {"everyTurns": -1}})",
                          R"({"sequencer": "fast"})",
                          R"({"storeRoot": 7})",
                          R"([1, 2])"}) {
            CAPTURE(text);
            auto config = engineConfigFromJson(nlohmann::json::parse(text));
            REQUIRE_FALSE(config.has_value());
            CHECK(config.error().code == Error::Code::MalformedInput);
        }
    }

    TEST_CASE("environment variables override the loaded config") {
        auto config = applyEnvironmentOverrides(EngineConfig{},
                                                lookupFrom({{"TURNSYNC_SNAPSHOT_EVERY_TURNS", "3"},
                                                            {"TURNSYNC_LOOKAHEAD_TURNS", "1"},
                                                            {"TURNSYNC_TURN_TIMEOUT_MS", "750"},
                                                            {"TURNSYNC_IDLE_EVICTION_MS", "60000"},
                                                            {"TURNSYNC_STORE_ROOT", "/tmp/ts"}}));
        REQUIRE(config.has_value());
        CHECK(config->snapshots.everyTurns == 3);
        CHECK(config->sequencer.lookaheadTurns == 1);
        CHECK(config->sequencer.turnTimeout == std::chrono::milliseconds{750});
        CHECK(config->session.idleEviction == std::chrono::milliseconds{60000});
        CHECK(config->storeRoot == std::filesystem::path("/tmp/ts"));
    }

    TEST_CASE("malformed environment values are rejected") {
        for (auto raw : {"ten", "-4", "", "12x", "0"}) {
            CAPTURE(raw);
            auto config = applyEnvironmentOverrides(EngineConfig{}, lookupFrom({{"TURNSYNC_SNAPSHOT_EVERY_TURNS", raw}}));
            REQUIRE_FALSE(config.has_value());
            CHECK(config.error().code == Error::Code::MalformedInput);
        }
    }

    TEST_CASE("config files load through the same parser") {
        TempDirectory dir;
        auto          path = dir.path() / "engine.json";
        REQUIRE(FileIo::writeTextFileAtomic(path, R"({"session": {"idleEvictionMs": 1000}})", false).has_value());
        auto config = loadEngineConfig(path);
        REQUIRE(config.has_value());
        CHECK(config->session.idleEviction == std::chrono::milliseconds{1000});

        auto missing = loadEngineConfig(dir.path() / "absent.json");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::NotFound);
    }
}
