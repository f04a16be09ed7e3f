#include "ArgParser.hpp"

#include <catch2/catch.hpp>

using namespace std::literals;

TEST_CASE("Argument parsing") {
    SECTION("should treat empty strings as such") {
        ArgParser ap(""sv);
        CHECK(ap.empty());
        CHECK(ap.shift().empty());
        CHECK(!ap.try_shift_number());
    }
    SECTION("should parse arguments") {
        ArgParser ap("route 12"sv);
        CHECK(ap.shift() == "route");
        CHECK(ap.shift() == "12");
        CHECK(ap.empty());
    }
    SECTION("should remove extraneous whitespace") {
        ArgParser ap("   go    north  \t east     "sv);
        CHECK(ap.shift() == "go");
        CHECK(ap.shift() == "north");
        CHECK(ap.shift() == "east");
        CHECK(ap.empty());
    }
    SECTION("should parse quotes") {
        ArgParser ap(R"(room 7 "Quiet Glade" 'A glade, thick with "moss".')"sv);
        CHECK(ap.shift() == "room");
        CHECK(ap.shift() == "7");
        CHECK(ap.shift() == "Quiet Glade");
        CHECK(ap.shift() == R"(A glade, thick with "moss".)");
        CHECK(ap.empty());
    }
    SECTION("should handle apostrophes inside words") {
        ArgParser ap(R"(harvest Yie'Stei's tree)"sv);
        CHECK(ap.shift() == "harvest");
        CHECK(ap.shift() == "Yie'Stei's");
        CHECK(ap.shift() == "tree");
        CHECK(ap.empty());
    }
    SECTION("should handle unmatched quotes") {
        ArgParser ap("'oh no"sv);
        CHECK(ap.shift() == "oh no");
        CHECK(ap.empty());
    }
    SECTION("should keep the remaining text") {
        ArgParser ap("message route_step You walk {direction}."sv);
        CHECK(ap.shift() == "message");
        CHECK(ap.shift() == "route_step");
        CHECK(ap.remaining() == "You walk {direction}.");
    }
    SECTION("should shift number arguments") {
        SECTION("simple arguments") {
            ArgParser ap("1 2 3 -200"sv);
            CHECK(ap.try_shift_number() == 1);
            CHECK(ap.try_shift_number() == 2);
            CHECK(ap.try_shift_number() == 3);
            CHECK(ap.try_shift_number() == -200);
            CHECK(!ap.try_shift_number());
        }
        SECTION("doesn't shift if not numeric") {
            ArgParser ap("1 a 2"sv);
            CHECK(ap.try_shift_number() == 1);
            CHECK(!ap.try_shift_number());
            CHECK(ap.shift() == "a");
            CHECK(ap.try_shift_number() == 2);
            CHECK(ap.empty());
        }
    }
}
