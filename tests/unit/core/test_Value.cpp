#include "core/Value.hpp"
#include "core/ValueJson.hpp"

#include <doctest/doctest.h>

using namespace TS;

TEST_SUITE("Value") {
    TEST_CASE("scalar kinds") {
        CHECK(Value{}.isNull());
        CHECK(Value{true}.isBool());
        CHECK(Value{42}.isInteger());
        CHECK(Value{std::uint64_t{7}}.asInteger() == 7);
        CHECK(Value{1.5}.isDouble());
        CHECK(Value{"text"}.isString());
        CHECK(Value::array().isArray());
        CHECK(Value::object().isObject());
        CHECK(kindToString(Value::Kind::Object) == "object");
    }

    TEST_CASE("numbers compare by value across integer and double") {
        CHECK(Value{3} == Value{3.0});
        CHECK_FALSE(Value{3} == Value{3.5});
        CHECK_FALSE(Value{"3"} == Value{3});
    }

    TEST_CASE("with helpers leave the original untouched") {
        auto base = Value::object({{"a", Value{1}}, {"list", Value::array({Value{1}, Value{2}})}});

        auto changed = base.withMember("a", Value{2});
        CHECK(base.find("a")->asInteger() == 1);
        CHECK(changed.find("a")->asInteger() == 2);
        // Untouched children are shared rather than copied.
        CHECK(changed.find("list")->sharesStorageWith(*base.find("list")));

        auto removed = base.withoutMember("a");
        CHECK(removed.find("a") == nullptr);
        CHECK(base.find("a") != nullptr);

        auto const& list = *base.find("list");
        CHECK(list.withAppended(Value{3}).size() == 3);
        CHECK(list.withoutElement(0).at(0)->asInteger() == 2);
        CHECK(list.withInserted(0, Value{0}).at(0)->asInteger() == 0);
        CHECK(list.withElement(1, Value{9}).at(1)->asInteger() == 9);
        CHECK(list.size() == 2);
    }

    TEST_CASE("with helpers reject the wrong container") {
        CHECK_THROWS_AS((void)Value{1}.withMember("a", Value{}), std::logic_error);
        CHECK_THROWS_AS((void)Value::array().withoutElement(0), std::out_of_range);
    }

    TEST_CASE("accessors return nullptr for absent slots") {
        auto tree = Value::object({{"a", Value::array({Value{1}})}});
        CHECK(tree.find("missing") == nullptr);
        CHECK(tree.find("a")->at(5) == nullptr);
        CHECK(Value{1}.find("a") == nullptr);
    }
}

TEST_SUITE("ValueJson") {
    TEST_CASE("canonical form sorts keys and is compact") {
        auto value = parseValue(R"({"b": 1, "a": [true, null, "x"], "c": {"z": 0, "y": -2}})");
        REQUIRE(value.has_value());
        CHECK(canonicalJson(*value) == R"({"a":[true,null,"x"],"b":1,"c":{"y":-2,"z":0}})");
    }

    TEST_CASE("equal trees built in different orders serialize identically") {
        auto first  = Value::object().withMember("x", Value{1}).withMember("y", Value{"two"});
        auto second = Value::object().withMember("y", Value{"two"}).withMember("x", Value{1});
        CHECK(canonicalJson(first) == canonicalJson(second));
    }

    TEST_CASE("integers stay integral through json") {
        auto value = parseValue(R"({"n": 12, "d": 1.25})");
        REQUIRE(value.has_value());
        CHECK(value->find("n")->isInteger());
        CHECK(value->find("d")->isDouble());
        CHECK(fromJson(toJson(*value)) == *value);
    }

    TEST_CASE("utf-8 validation") {
        CHECK(isValidUtf8(""));
        CHECK(isValidUtf8("plain ascii"));
        CHECK(isValidUtf8("caf\xc3\xa9 \xe2\x9a\x94 \xf0\x9f\x90\x89"));
        CHECK_FALSE(isValidUtf8("\xff"));
        CHECK_FALSE(isValidUtf8("\xc3"));           // truncated
        CHECK_FALSE(isValidUtf8("\xc0\xaf"));       // overlong '/'
        CHECK_FALSE(isValidUtf8("\xed\xa0\x80"));   // surrogate
        CHECK_FALSE(isValidUtf8("\xf4\x90\x80\x80")); // past U+10FFFF

        CHECK_FALSE(holdsInvalidUtf8(Value::array({Value{"ok"}, Value{1}})));
        CHECK(holdsInvalidUtf8(Value::array({Value{"ok"}, Value{std::string("\xfe")}})));
        CHECK(holdsInvalidUtf8(Value::object({{std::string("\xfe"), Value{}}})));
    }

    TEST_CASE("canonical form does not throw on text that is not UTF-8") {
        auto tree = Value::object({{"name", Value{std::string("\xff\xfe")}}});
        std::string text;
        CHECK_NOTHROW(text = canonicalJson(tree));
        CHECK(text == "{\"name\":\"\xef\xbf\xbd\xef\xbf\xbd\"}");
    }

    TEST_CASE("malformed text is rejected") {
        auto value = parseValue("{not json");
        REQUIRE_FALSE(value.has_value());
        CHECK(value.error().code == Error::Code::MalformedInput);
    }
}
