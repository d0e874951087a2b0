#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace trellis {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_layoutLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_coreLogger = std::make_shared<spdlog::logger>("CORE", sinks.begin(), sinks.end());
    s_layoutLogger = std::make_shared<spdlog::logger>("LAYOUT", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_layoutLogger->set_level(spdLevel);

    // register_logger throws on duplicate names
    spdlog::drop("CORE");
    spdlog::drop("LAYOUT");
    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_layoutLogger);
}

void Log::shutdown() {
    if (s_coreLogger) s_coreLogger->flush();
    if (s_layoutLogger) s_layoutLogger->flush();
    spdlog::shutdown();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger>& Log::getCoreLogger() {
    if (!s_coreLogger) init();
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Log::getLayoutLogger() {
    if (!s_layoutLogger) init();
    return s_layoutLogger;
}

} // namespace trellis
