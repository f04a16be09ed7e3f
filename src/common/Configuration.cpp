#include "Configuration.hpp"

#include <fmt/format.h>

#include <cstdlib>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

using namespace std::literals;

Configuration::Configuration()
    : world_file_(require_file_env(NEWHAVEN_WORLD_FILE_ENV)), port_(int_env(NEWHAVEN_PORT_ENV, 4000)),
      tick_interval_(millis_env(NEWHAVEN_TICK_MS_ENV, 1000ms)),
      step_delay_(millis_env(NEWHAVEN_STEP_DELAY_MS_ENV, 1000ms)),
      loop_step_delay_(millis_env(NEWHAVEN_LOOP_STEP_DELAY_MS_ENV, 2000ms)),
      max_connections_(int_env(NEWHAVEN_MAX_CONNECTIONS_ENV, 200)) {}

bool Configuration::is_readable_file(const char *filename) {
    if (!filename) {
        return false;
    }
    struct stat file;
    return !stat(filename, &file) && S_ISREG(file.st_mode) && access(filename, R_OK) == 0;
}

std::string Configuration::require_file_env(const std::string &envkey) {
    const auto value = std::getenv(envkey.c_str());
    if (!is_readable_file(value)) {
        throw std::invalid_argument(
            fmt::format("An environment variable called {} must specify a readable file", envkey));
    }
    return value;
}

int Configuration::int_env(const std::string &envkey, const int default_value) {
    const auto value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    const auto parsed = atoi(value);
    return parsed > 0 ? parsed : default_value;
}

Millis Configuration::millis_env(const std::string &envkey, const Millis default_value) {
    return Millis(int_env(envkey, static_cast<int>(default_value.count())));
}
