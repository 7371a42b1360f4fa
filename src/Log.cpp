#include "Log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

static std::shared_ptr<spdlog::logger> g_logger;

void logsys::init(spdlog::level::level_enum level) {
    if (!g_logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        g_logger = std::make_shared<spdlog::logger>("salvo", sink);
        spdlog::set_default_logger(g_logger);
        g_logger->set_pattern("[%H:%M:%S.%e][%l] %v");
    }
    g_logger->set_level(level);
    g_logger->debug("Logging started");
}

std::shared_ptr<spdlog::logger> logsys::get() {
    if (!g_logger) init(spdlog::level::warn);
    return g_logger;
}

spdlog::level::level_enum logsys::parse_level(const std::string& name, bool& ok) {
    auto level = spdlog::level::from_str(name);
    // from_str falls back to "off" for anything it doesn't know
    ok = level != spdlog::level::off || name == "off";
    return level;
}
