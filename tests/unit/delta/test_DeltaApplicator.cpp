#include "delta/DeltaApplicator.hpp"
#include "delta/DeltaValidator.hpp"

#include "TurnSyncTestHelpers.hpp"

#include <cstdint>
#include <limits>

using namespace TS;
using TS::Testing::makeDelta;
using TS::Testing::sampleState;

namespace {

auto at(Value const& state, std::string_view path) -> Value {
    auto parsed = parseDeltaPath(path);
    REQUIRE(parsed.has_value());
    auto value = PathResolver::resolve(state, *parsed);
    REQUIRE_MESSAGE(value.has_value(), "nothing at " << path);
    return *value;
}

auto applyOk(Value const& state, Delta const& delta) -> DeltaApplicator::Applied {
    auto applied = DeltaApplicator::apply(state, delta);
    REQUIRE_MESSAGE(applied.has_value(), describeError(applied.error()));
    return *applied;
}

auto applyError(Value const& state, Delta const& delta) -> Error::Code {
    auto applied = DeltaApplicator::apply(state, delta);
    REQUIRE_FALSE(applied.has_value());
    return applied.error().code;
}

} // namespace

TEST_SUITE("DeltaApplicator") {
    TEST_CASE("increment records the previous value") {
        auto state   = sampleState();
        auto applied = applyOk(state, makeDelta(1, "player", "hp", DeltaOp::Increment, Value{-3}));
        CHECK(at(applied.state, "player.hp") == Value{7});
        CHECK(at(applied.state, "player.hp").isInteger());
        REQUIRE(applied.effective.previousValue.has_value());
        CHECK(*applied.effective.previousValue == Value{10});
        CHECK(at(state, "player.hp") == Value{10});
    }

    TEST_CASE("increment mixes integers and doubles") {
        auto state   = sampleState();
        auto applied = applyOk(state, makeDelta(1, "player", "stats.luck", DeltaOp::Increment, Value{1}));
        CHECK(at(applied.state, "player.stats.luck") == Value{1.5});
        auto toDouble = applyOk(state, makeDelta(1, "player", "gold", DeltaOp::Increment, Value{0.25}));
        CHECK(at(toDouble.state, "player.gold").isDouble());
    }

    TEST_CASE("integer increments that would overflow fall back to double") {
        auto state   = applyOk(sampleState(), makeDelta(1, "player", "gold", DeltaOp::Set,
                                                      Value{std::numeric_limits<std::int64_t>::max() - 1})).state;
        auto fits    = applyOk(state, makeDelta(1, "player", "gold", DeltaOp::Increment, Value{1}));
        CHECK(at(fits.state, "player.gold").isInteger());
        CHECK(at(fits.state, "player.gold").asInteger() == std::numeric_limits<std::int64_t>::max());
        auto spilled = applyOk(fits.state, makeDelta(1, "player", "gold", DeltaOp::Increment, Value{1}));
        CHECK(at(spilled.state, "player.gold").isDouble());

        auto low = applyOk(sampleState(), makeDelta(1, "player", "gold", DeltaOp::Set,
                                                    Value{std::numeric_limits<std::int64_t>::min()})).state;
        CHECK(at(applyOk(low, makeDelta(1, "player", "gold", DeltaOp::Increment, Value{-1})).state, "player.gold").isDouble());
        CHECK(at(applyOk(low, makeDelta(1, "player", "gold", DeltaOp::Increment, Value{5})).state, "player.gold").isInteger());
    }

    TEST_CASE("increment on a non-number is a type mismatch") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "name", DeltaOp::Increment, Value{1})) == Error::Code::TypeMismatch);
        CHECK(applyError(state, makeDelta(1, "player", "hp", DeltaOp::Increment, Value{"1"})) == Error::Code::TypeMismatch);
    }

    TEST_CASE("set creates a fresh key and replaces an existing one") {
        auto state = sampleState();
        auto fresh = applyOk(state, makeDelta(1, "world", "season", DeltaOp::Set, Value{"winter"}));
        CHECK(at(fresh.state, "world.season") == Value{"winter"});
        CHECK_FALSE(fresh.effective.previousValue.has_value());

        auto replaced = applyOk(state, makeDelta(1, "world", "weather", DeltaOp::Set, Value{"storm"}));
        CHECK(at(replaced.state, "world.weather") == Value{"storm"});
        CHECK(replaced.effective.previousValue == std::optional<Value>{Value{"clear"}});
    }

    TEST_CASE("set with a missing intermediate key is a missing parent") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "pack.items", DeltaOp::Set, Value{1})) == Error::Code::MissingParent);
    }

    TEST_CASE("set through a wildcard is refused") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "inventory[*]", DeltaOp::Set, Value{"x"}))
              == Error::Code::InvalidWildcardUsage);
    }

    TEST_CASE("push appends through a wildcard or to the named array") {
        auto state   = sampleState();
        auto pushed  = applyOk(state, makeDelta(1, "player", "inventory[*]", DeltaOp::Push, Value{"torch"}));
        auto list    = at(pushed.state, "player.inventory");
        REQUIRE(list.size() == 3);
        CHECK(*list.at(2) == Value{"torch"});
        CHECK_FALSE(pushed.effective.previousValue.has_value());

        auto named = applyOk(state, makeDelta(1, "player", "inventory", DeltaOp::Push, Value{"map"}));
        CHECK(at(named.state, "player.inventory").size() == 3);
    }

    TEST_CASE("push onto a non-array is a type mismatch") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "name", DeltaOp::Push, Value{"x"})) == Error::Code::TypeMismatch);
    }

    TEST_CASE("pull removes the first deep-equal element") {
        auto state  = sampleState();
        auto pulled = applyOk(state, makeDelta(1, "player", "inventory", DeltaOp::Pull, Value{"sword"}));
        auto list   = at(pulled.state, "player.inventory");
        REQUIRE(list.size() == 1);
        CHECK(*list.at(0) == Value{"rope"});
    }

    TEST_CASE("pull without a match is element not found") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "inventory", DeltaOp::Pull, Value{"shield"}))
              == Error::Code::ElementNotFound);
    }

    TEST_CASE("delete removes keys and compacts arrays") {
        auto state   = sampleState();
        auto key     = applyOk(state, makeDelta(1, "npc:guard", "mood", DeltaOp::Delete));
        CHECK(at(key.state, "npcs.guard").find("mood") == nullptr);
        CHECK(key.effective.previousValue == std::optional<Value>{Value{"wary"}});

        auto element = applyOk(state, makeDelta(1, "player", "inventory[0]", DeltaOp::Delete));
        auto list    = at(element.state, "player.inventory");
        REQUIRE(list.size() == 1);
        CHECK(*list.at(0) == Value{"rope"});
    }

    TEST_CASE("delete of an absent slot is not found") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "player", "mana", DeltaOp::Delete)) == Error::Code::NotFound);
    }

    TEST_CASE("deltas on an unknown npc are not found") {
        auto state = sampleState();
        CHECK(applyError(state, makeDelta(1, "npc:ghost", "hp", DeltaOp::Set, Value{1})) == Error::Code::NotFound);
    }

    TEST_CASE("scene target addresses currentScene") {
        auto state   = sampleState();
        auto applied = applyOk(state, makeDelta(1, "scene", "name", DeltaOp::Set, Value{"Hall"}));
        CHECK(at(applied.state, "currentScene.name") == Value{"Hall"});
    }

    TEST_CASE("revert undoes every op") {
        auto state  = sampleState();
        auto deltas = std::vector<Delta>{
                makeDelta(1, "player", "hp", DeltaOp::Increment, Value{-4}),
                makeDelta(1, "world", "weather", DeltaOp::Set, Value{"fog"}),
                makeDelta(1, "world", "season", DeltaOp::Set, Value{"spring"}),
                makeDelta(1, "player", "inventory[*]", DeltaOp::Push, Value{"lamp"}),
                makeDelta(1, "player", "inventory", DeltaOp::Pull, Value{"sword"}),
                makeDelta(1, "player", "inventory[0]", DeltaOp::Delete),
                makeDelta(1, "npc:guard", "mood", DeltaOp::Delete),
        };
        for (auto const& delta : deltas) {
            CAPTURE(delta.path);
            auto applied  = applyOk(state, delta);
            auto reverted = DeltaApplicator::revert(applied.state, applied.effective);
            REQUIRE_MESSAGE(reverted.has_value(), describeError(reverted.error()));
            CHECK(*reverted == state);
        }
    }

    TEST_CASE("revert of a delete in the middle of an array restores the position") {
        auto state = sampleState();
        state      = applyOk(state, makeDelta(1, "player", "inventory[*]", DeltaOp::Push, Value{"lamp"})).state;
        auto applied  = applyOk(state, makeDelta(1, "player", "inventory[1]", DeltaOp::Delete));
        auto reverted = DeltaApplicator::revert(applied.state, applied.effective);
        REQUIRE(reverted.has_value());
        CHECK(*reverted == state);
    }

    TEST_CASE("revert without a recorded previous value is malformed") {
        auto state = sampleState();
        auto delta = makeDelta(1, "player", "hp", DeltaOp::Increment, Value{1});
        auto reverted = DeltaApplicator::revert(state, delta);
        REQUIRE_FALSE(reverted.has_value());
        CHECK(reverted.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("applying the same sequence twice yields identical trees") {
        auto run = [](Value state) {
            for (auto delta : {makeDelta(1, "player", "gold", DeltaOp::Increment, Value{3}),
                               makeDelta(1, "player", "inventory[*]", DeltaOp::Push, Value{"coin"}),
                               makeDelta(1, "world", "day", DeltaOp::Increment, Value{1})}) {
                state = applyOk(state, delta).state;
            }
            return state;
        };
        auto first  = run(sampleState());
        auto second = run(sampleState());
        CHECK(first == second);
        CHECK(canonicalJson(first) == canonicalJson(second));
    }
}

TEST_SUITE("DeltaValidator") {
    TEST_CASE("validate does not touch the state") {
        auto state = sampleState();
        auto copy  = state;
        CHECK(DeltaValidator::validate(state, makeDelta(1, "player", "hp", DeltaOp::Increment, Value{1})).has_value());
        CHECK(state.sharesStorageWith(copy));
    }

    TEST_CASE("invalid paths and targets are reported") {
        auto state = sampleState();
        auto path  = DeltaValidator::validate(state, makeDelta(1, "player", "hp..x", DeltaOp::Set, Value{1}));
        REQUIRE_FALSE(path.has_value());
        CHECK(path.error().code == Error::Code::InvalidPath);

        auto inner = DeltaValidator::validate(state, makeDelta(1, "player", "inventory[*].x", DeltaOp::Push, Value{1}));
        REQUIRE_FALSE(inner.has_value());
        CHECK(inner.error().code == Error::Code::InvalidWildcardUsage);

        auto target = DeltaValidator::validate(state, makeDelta(1, "moon", "hp", DeltaOp::Set, Value{1}));
        REQUIRE_FALSE(target.has_value());
        CHECK(target.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("values holding text that is not UTF-8 are malformed") {
        auto state = sampleState();
        auto name  = DeltaValidator::validate(state, makeDelta(1, "player", "name", DeltaOp::Set, Value{std::string("Ar\xc0\xaf" "a")}));
        REQUIRE_FALSE(name.has_value());
        CHECK(name.error().code == Error::Code::MalformedInput);

        auto nested = Value::object({{std::string("\xed\xa0\x80"), Value{1}}});
        auto key    = DeltaValidator::validate(state, makeDelta(1, "player", "inventory", DeltaOp::Push, nested));
        REQUIRE_FALSE(key.has_value());
        CHECK(key.error().code == Error::Code::MalformedInput);

        CHECK(DeltaValidator::validate(state, makeDelta(1, "player", "name", DeltaOp::Set, Value{"Ærwen ⚔"})).has_value());
    }

    TEST_CASE("mutate options follow the op") {
        auto wildcard = *parseDeltaPath("inventory[*]");
        auto plain    = *parseDeltaPath("hp");
        CHECK(DeltaValidator::mutateOptionsFor(DeltaOp::Set, plain).createMissingKey);
        CHECK(DeltaValidator::mutateOptionsFor(DeltaOp::Push, wildcard).allowAppend);
        CHECK_FALSE(DeltaValidator::mutateOptionsFor(DeltaOp::Push, plain).allowAppend);
        CHECK(DeltaValidator::mutateOptionsFor(DeltaOp::Increment, plain).missingIntermediate == Error::Code::MissingKey);
        CHECK(DeltaValidator::mutateOptionsFor(DeltaOp::Set, plain).missingIntermediate == Error::Code::MissingParent);
    }

    TEST_CASE("findElement compares deeply") {
        auto array = Value::array({Value{1}, Value::object({{"k", Value{"v"}}}), Value{"x"}});
        auto index = DeltaValidator::findElement(array, Value::object({{"k", Value{"v"}}}));
        REQUIRE(index.has_value());
        CHECK(*index == 1);
        CHECK_FALSE(DeltaValidator::findElement(array, Value{2}).has_value());
    }
}
