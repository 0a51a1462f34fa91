#include <doctest/doctest.h>

#include <cstdint>
#include <vaxchain/ledger/json.hpp>

using namespace vaxchain;
using namespace vaxchain::ledger;

TEST_SUITE("JSON codec") {
    TEST_CASE("Parse scalar members") {
        auto parsed = JsonValue::parse(R"({"id":"u1","count":42,"neg":-7,"ok":true,"none":null})");
        REQUIRE(parsed.is_ok());
        const auto &obj = parsed.value();
        CHECK(obj.isObject());

        REQUIRE(obj.find("id") != nullptr);
        CHECK(obj.find("id")->asString() == "u1");
        CHECK(obj.find("count")->asInt().value() == 42);
        CHECK(obj.find("neg")->asInt().value() == -7);
        CHECK(obj.find("ok")->asBool());
        CHECK(obj.find("none")->isNull());
        CHECK(obj.find("missing") == nullptr);
    }

    TEST_CASE("Nested arrays and objects") {
        auto parsed = JsonValue::parse(R"( { "items" : [1, {"a":"b"}, [true, false]] } )");
        REQUIRE(parsed.is_ok());
        const JsonValue *items = parsed.value().find("items");
        REQUIRE(items != nullptr);
        REQUIRE(items->isArray());
        REQUIRE(items->items().size() == 3);
        CHECK(items->items()[1].find("a")->asString() == "b");
        CHECK(items->items()[2].items().size() == 2);
    }

    TEST_CASE("String escapes") {
        SUBCASE("Decode") {
            auto parsed = JsonValue::parse(R"({"s":"line\nbreak \"quoted\" \u00e9 tab\t"})");
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value().find("s")->asString() == "line\nbreak \"quoted\" \xc3\xa9 tab\t");
        }

        SUBCASE("Encode") {
            CHECK(JsonSerializer::quote("a\"b") == "\"a\\\"b\"");
            CHECK(JsonSerializer::escapeJson("back\\slash") == "back\\\\slash");
            CHECK(JsonSerializer::escapeJson(std::string("nul\x01", 4)) == "nul\\u0001");
        }
    }

    TEST_CASE("Integers") {
        SUBCASE("Fractions are not integers") {
            auto parsed = JsonValue::parse(R"({"price":1.5,"exp":1e3})");
            REQUIRE(parsed.is_ok());
            CHECK_FALSE(parsed.value().find("price")->asInt().is_ok());
            CHECK_FALSE(parsed.value().find("exp")->asInt().is_ok());
        }

        SUBCASE("Out of range") {
            auto parsed = JsonValue::parse(R"({"n":99999999999999999999})");
            REQUIRE(parsed.is_ok());
            auto n = parsed.value().find("n")->asInt();
            REQUIRE_FALSE(n.is_ok());
            CHECK(n.error().code == ERR_DECODE);
        }

        SUBCASE("64-bit values") {
            auto parsed = JsonValue::parse(R"({"n":9223372036854775807})");
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value().find("n")->asInt().value() == INT64_MAX);
        }
    }

    TEST_CASE("Malformed input is a decode error") {
        const char *inputs[] = {
            "",          "{",           R"({"a":})",  R"({"a" 1})", R"({"a":1,})",
            R"({"a":1} x)", R"(["unterminated)", "tru",  "-",         R"({"a":01x})",
        };
        for (const char *input : inputs) {
            CAPTURE(input);
            auto parsed = JsonValue::parse(input);
            REQUIRE_FALSE(parsed.is_ok());
            CHECK(parsed.error().code == ERR_DECODE);
        }
    }

    TEST_CASE("Nesting depth is bounded") {
        std::string deep(200, '[');
        deep += std::string(200, ']');
        CHECK_FALSE(JsonValue::parse(deep).is_ok());
    }

    TEST_CASE("Dump is compact and preserves member order") {
        auto parsed = JsonValue::parse(R"({ "b" : 1 , "a" : [ "x" , null ] })");
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().dump() == R"({"b":1,"a":["x",null]})");
    }

    TEST_CASE("Writer") {
        std::string json = JsonWriter()
                               .field("id", "u1")
                               .field("count", int64_t(3))
                               .field("flag", false)
                               .fieldIfSet("empty", "")
                               .fieldIfSet("set", "v")
                               .raw("nested", "[1,2]")
                               .str();
        CHECK(json == R"({"id":"u1","count":3,"flag":false,"set":"v","nested":[1,2]})");
        CHECK(JsonWriter().str() == "{}");
    }

    TEST_CASE("Array join keeps documents verbatim") {
        CHECK(joinJsonArray({}) == "[]");
        CHECK(joinJsonArray({R"({"a":1})", R"({"b":2})"}) == R"([{"a":1},{"b":2}])");
    }
}
