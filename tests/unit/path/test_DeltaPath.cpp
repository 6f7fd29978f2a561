#include "path/DeltaPath.hpp"
#include "path/PathResolver.hpp"

#include "TurnSyncTestHelpers.hpp"

using namespace TS;
using TS::Testing::sampleState;

TEST_SUITE("DeltaPath") {
    TEST_CASE("parses keys, indices and the append wildcard") {
        auto path = parseDeltaPath("inventory[2].charges");
        REQUIRE(path.has_value());
        REQUIRE(path->size() == 3);
        CHECK(path->steps()[0] == PathStep::key("inventory"));
        CHECK(path->steps()[1] == PathStep::index(2));
        CHECK(path->steps()[2] == PathStep::key("charges"));
        CHECK(path->toString() == "inventory[2].charges");

        auto append = parseDeltaPath("inventory[*]");
        REQUIRE(append.has_value());
        CHECK(append->endsWithAppend());
        CHECK_FALSE(append->hasInnerAppend());
        CHECK(append->parent().toString() == "inventory");
    }

    TEST_CASE("inner wildcards are detected") {
        auto path = parseDeltaPath("party[*].hp");
        REQUIRE(path.has_value());
        CHECK(path->hasInnerAppend());
        CHECK_FALSE(path->endsWithAppend());
    }

    TEST_CASE("rejects malformed text") {
        for (auto text : {"", "1abc", ".hp", "hp.", "hp[", "hp[x]", "hp[1", "hp..mp", "hp[-1]", "h p", "_hp"}) {
            CAPTURE(text);
            auto path = parseDeltaPath(text);
            REQUIRE_FALSE(path.has_value());
            CHECK(path.error().code == Error::Code::InvalidPath);
        }
    }

    TEST_CASE("identifiers allow digits and underscores after the first letter") {
        auto path = parseDeltaPath("quest_log2.entry_1");
        REQUIRE(path.has_value());
        CHECK(path->size() == 2);
    }

    TEST_CASE("joined prefixes a target root") {
        auto root = DeltaPath{std::vector<PathStep>{PathStep::key("npcs"), PathStep::key("guard-01")}};
        auto rel  = parseDeltaPath("hp");
        REQUIRE(rel.has_value());
        auto full = root.joined(*rel);
        CHECK(full.size() == 3);
        CHECK(full.terminal() == PathStep::key("hp"));
    }
}

TEST_SUITE("PathResolver") {
    TEST_CASE("resolve walks keys and indices") {
        auto state = sampleState();
        auto path  = parseDeltaPath("player.inventory[1]");
        REQUIRE(path.has_value());
        auto value = PathResolver::resolve(state, *path);
        REQUIRE(value.has_value());
        CHECK(*value == Value{"rope"});
    }

    TEST_CASE("resolve reports the first failing step") {
        auto state = sampleState();
        auto missing = PathResolver::resolve(state, *parseDeltaPath("player.mana"));
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::MissingKey);

        auto range = PathResolver::resolve(state, *parseDeltaPath("player.inventory[7]"));
        REQUIRE_FALSE(range.has_value());
        CHECK(range.error().code == Error::Code::IndexOutOfRange);

        auto wildcard = PathResolver::resolve(state, *parseDeltaPath("player.inventory[*]"));
        REQUIRE_FALSE(wildcard.has_value());
        CHECK(wildcard.error().code == Error::Code::InvalidWildcardUsage);
    }

    TEST_CASE("mutate copies only the spine to the slot") {
        auto state   = sampleState();
        auto path    = *parseDeltaPath("player.hp");
        auto updated = PathResolver::mutate(state, path, [](Value const* current) -> Expected<std::optional<Value>> {
            return std::optional<Value>{Value{current->asInteger() + 1}};
        });
        REQUIRE(updated.has_value());
        CHECK(updated->find("player")->find("hp")->asInteger() == 11);
        CHECK(state.find("player")->find("hp")->asInteger() == 10);
        CHECK(updated->find("npcs")->sharesStorageWith(*state.find("npcs")));
        CHECK(updated->find("player")->find("inventory")->sharesStorageWith(*state.find("player")->find("inventory")));
    }

    TEST_CASE("missing intermediate keys use the configured code") {
        auto state = sampleState();
        auto path  = *parseDeltaPath("player.pack.items");
        auto keep  = [](Value const*) -> Expected<std::optional<Value>> { return std::optional<Value>{Value{1}}; };

        PathResolver::MutateOptions options;
        options.createMissingKey    = true;
        options.missingIntermediate = Error::Code::MissingParent;
        auto parent = PathResolver::mutate(state, path, keep, options);
        REQUIRE_FALSE(parent.has_value());
        CHECK(parent.error().code == Error::Code::MissingParent);

        options.missingIntermediate = Error::Code::MissingKey;
        auto key = PathResolver::mutate(state, path, keep, options);
        REQUIRE_FALSE(key.has_value());
        CHECK(key.error().code == Error::Code::MissingKey);
    }

    TEST_CASE("append requires the option") {
        auto state = sampleState();
        auto path  = *parseDeltaPath("player.inventory[*]");
        auto push  = [](Value const* current) -> Expected<std::optional<Value>> {
            CHECK(current == nullptr);
            return std::optional<Value>{Value{"torch"}};
        };
        auto refused = PathResolver::mutate(state, path, push);
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::InvalidWildcardUsage);

        PathResolver::MutateOptions options;
        options.allowAppend = true;
        auto appended = PathResolver::mutate(state, path, push, options);
        REQUIRE(appended.has_value());
        CHECK(appended->find("player")->find("inventory")->size() == 3);
    }
}
