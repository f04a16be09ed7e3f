#include "Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace {

std::shared_ptr<spdlog::sinks::sink> shared_console_sink() {
    // The scheduler thread creates loggers too, so the sink is built exactly once.
    static std::once_flag once;
    static std::shared_ptr<spdlog::sinks::sink> sink;
    std::call_once(once, [] { sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(); });
    return sink;
}

}

Logger logger_for(std::string name) {
    auto logger = spdlog::logger(std::move(name), shared_console_sink());
    logger.set_level(spdlog::default_logger()->level());
    return logger;
}

void set_log_level(spdlog::level::level_enum level) { spdlog::set_level(level); }
