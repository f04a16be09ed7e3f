#include "common/Configuration.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <stdexcept>

using namespace std::literals;

namespace {
void apply_default_settings() {
    REQUIRE(setenv(NEWHAVEN_WORLD_FILE_ENV, TEST_DATA_DIR "/world.txt", 1) == 0);
    REQUIRE(unsetenv(NEWHAVEN_PORT_ENV) == 0);
    REQUIRE(unsetenv(NEWHAVEN_TICK_MS_ENV) == 0);
    REQUIRE(unsetenv(NEWHAVEN_STEP_DELAY_MS_ENV) == 0);
    REQUIRE(unsetenv(NEWHAVEN_LOOP_STEP_DELAY_MS_ENV) == 0);
    REQUIRE(unsetenv(NEWHAVEN_MAX_CONNECTIONS_ENV) == 0);
}
}

TEST_CASE("Configuration initialized") {
    apply_default_settings();

    SECTION("world file") {
        Configuration config;

        REQUIRE(config.world_file() == TEST_DATA_DIR "/world.txt");
    }
    SECTION("defaults") {
        Configuration config;

        CHECK(config.port() == 4000);
        CHECK(config.tick_interval() == 1000ms);
        CHECK(config.step_delay() == 1000ms);
        CHECK(config.loop_step_delay() == 2000ms);
        CHECK(config.max_connections() == 200);
    }
    SECTION("overridden") {
        REQUIRE(setenv(NEWHAVEN_PORT_ENV, "9000", 1) == 0);
        REQUIRE(setenv(NEWHAVEN_TICK_MS_ENV, "250", 1) == 0);
        REQUIRE(setenv(NEWHAVEN_STEP_DELAY_MS_ENV, "500", 1) == 0);
        REQUIRE(setenv(NEWHAVEN_LOOP_STEP_DELAY_MS_ENV, "750", 1) == 0);
        REQUIRE(setenv(NEWHAVEN_MAX_CONNECTIONS_ENV, "3", 1) == 0);
        Configuration config;

        CHECK(config.port() == 9000);
        CHECK(config.tick_interval() == 250ms);
        CHECK(config.step_delay() == 500ms);
        CHECK(config.loop_step_delay() == 750ms);
        CHECK(config.max_connections() == 3);
    }
    SECTION("nonsense numbers are ignored") {
        REQUIRE(setenv(NEWHAVEN_TICK_MS_ENV, "soon", 1) == 0);
        REQUIRE(setenv(NEWHAVEN_PORT_ENV, "-1", 1) == 0);
        Configuration config;

        CHECK(config.tick_interval() == 1000ms);
        CHECK(config.port() == 4000);
    }
    SECTION("port from the command line") {
        Configuration config;
        config.override_port(4242);

        CHECK(config.port() == 4242);
    }
    SECTION("world file must exist") {
        REQUIRE(setenv(NEWHAVEN_WORLD_FILE_ENV, TEST_DATA_DIR "/no-such-world.txt", 1) == 0);

        REQUIRE_THROWS_AS(Configuration(), std::invalid_argument);
    }
    SECTION("world file must be a file") {
        REQUIRE(setenv(NEWHAVEN_WORLD_FILE_ENV, TEST_DATA_DIR, 1) == 0);

        REQUIRE_THROWS_AS(Configuration(), std::invalid_argument);
    }
    SECTION("world file must be given") {
        REQUIRE(unsetenv(NEWHAVEN_WORLD_FILE_ENV) == 0);

        REQUIRE_THROWS_AS(Configuration(), std::invalid_argument);
    }
    apply_default_settings();
}
