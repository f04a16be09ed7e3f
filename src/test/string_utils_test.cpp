#include "string_utils.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <string_view>
using namespace std::literals;

TEST_CASE("string_util tests") {
    SECTION("should determine numbers") {
        CHECK(is_number("0"));
        CHECK(is_number("123"));
        CHECK(is_number("-123"));
        CHECK(is_number("+123"));
        CHECK(!is_number("a"));
        CHECK(!is_number("1-1"));
        CHECK(!is_number("-+123"));
        CHECK(!is_number("-"));
        CHECK(!is_number(""));
    }
    SECTION("should parse numbers") {
        SECTION("valid numbers should parse") {
            CHECK(parse_number("0") == 0);
            CHECK(parse_number("123") == 123);
            CHECK(parse_number("-123") == -123);
            CHECK(parse_number("+123") == 123);
        }
        SECTION("invalid numbers parse as zero") {
            CHECK(parse_number("a") == 0);
            CHECK(parse_number("1-1") == 0);
            CHECK(parse_number("") == 0);
        }
        SECTION("out of range numbers saturate") {
            CHECK(parse_number("99999999999") == std::numeric_limits<int>::max());
            CHECK(parse_number("-99999999999") == std::numeric_limits<int>::min());
        }
    }
    SECTION("should trim") {
        CHECK(trim("") == ""sv);
        CHECK(trim("   ") == ""sv);
        CHECK(trim("  look \t") == "look"sv);
        CHECK(trim("go north") == "go north"sv);
    }
    SECTION("should lower case") {
        CHECK(lower_case("Pulsewood HARVESTER") == "pulsewood harvester");
        CHECK(lower_case("") == "");
    }
    SECTION("should match case insensitively") {
        CHECK(matches("Aria", "aRIA"));
        CHECK(!matches("Aria", "Arian"));
        CHECK(matches_start("nor", "North"));
        CHECK(!matches_start("", "North"));
        CHECK(!matches_start("northern", "North"));
    }
    SECTION("should match names by any word") {
        CHECK(matches_name("pulse", "Pulsewood Harvester"));
        CHECK(matches_name("HARV", "Pulsewood Harvester"));
        CHECK(matches_name("pulsewood h", "Pulsewood Harvester"));
        CHECK(!matches_name("wood", "Pulsewood Harvester"));
        CHECK(!matches_name("", "Pulsewood Harvester"));
    }
    SECTION("should join") {
        CHECK(join({}, ", ") == "");
        CHECK(join({"N"}, ", ") == "N");
        CHECK(join({"", "N", "E"}, ", ") == ", N, E");
    }
}
