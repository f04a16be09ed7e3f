#pragma once

#include "Time.hpp"

#include <string>

/**
 * Environment variables read by Configuration.
 */
static inline constexpr auto NEWHAVEN_PORT_ENV = "NEWHAVEN_PORT";
static inline constexpr auto NEWHAVEN_WORLD_FILE_ENV = "NEWHAVEN_WORLD_FILE";
static inline constexpr auto NEWHAVEN_TICK_MS_ENV = "NEWHAVEN_TICK_MS";
static inline constexpr auto NEWHAVEN_STEP_DELAY_MS_ENV = "NEWHAVEN_STEP_DELAY_MS";
static inline constexpr auto NEWHAVEN_LOOP_STEP_DELAY_MS_ENV = "NEWHAVEN_LOOP_STEP_DELAY_MS";
static inline constexpr auto NEWHAVEN_MAX_CONNECTIONS_ENV = "NEWHAVEN_MAX_CONNECTIONS";

/**
 * Server settings, read once from the environment when constructed.
 * The world file is mandatory, everything else has a default.
 */
class Configuration {
public:
    Configuration();
    [[nodiscard]] std::string world_file() const { return world_file_; }
    [[nodiscard]] uint port() const noexcept { return port_; }
    [[nodiscard]] Millis tick_interval() const noexcept { return tick_interval_; }
    [[nodiscard]] Millis step_delay() const noexcept { return step_delay_; }
    [[nodiscard]] Millis loop_step_delay() const noexcept { return loop_step_delay_; }
    [[nodiscard]] size_t max_connections() const noexcept { return max_connections_; }

    // Command line overrides take precedence over the environment.
    void override_port(uint port) noexcept { port_ = port; }

private:
    [[nodiscard]] static bool is_readable_file(const char *filename);
    [[nodiscard]] static std::string require_file_env(const std::string &envkey);
    [[nodiscard]] static int int_env(const std::string &envkey, const int default_value);
    [[nodiscard]] static Millis millis_env(const std::string &envkey, const Millis default_value);

    std::string world_file_;
    uint port_;
    Millis tick_interval_;
    Millis step_delay_;
    Millis loop_step_delay_;
    size_t max_connections_;
};
