#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace trellis {

/// Process-wide loggers. CORE covers configuration and the demo driver,
/// LAYOUT covers measure/arrange passes.
class Log {
public:
    /// (Re)create both loggers. Previously registered loggers with the same
    /// names are replaced. Unknown levels fall back to "info".
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// Both getters initialise console-only loggers on first use.
    static std::shared_ptr<spdlog::logger>& getCoreLogger();
    static std::shared_ptr<spdlog::logger>& getLayoutLogger();

    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_layoutLogger;
};

} // namespace trellis

// Core logging macros
#define LOG_TRACE(...)    ::trellis::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::trellis::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::trellis::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::trellis::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::trellis::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::trellis::Log::getCoreLogger()->critical(__VA_ARGS__)

// Layout logging macros
#define LAYOUT_LOG_TRACE(...)    ::trellis::Log::getLayoutLogger()->trace(__VA_ARGS__)
#define LAYOUT_LOG_DEBUG(...)    ::trellis::Log::getLayoutLogger()->debug(__VA_ARGS__)
#define LAYOUT_LOG_INFO(...)     ::trellis::Log::getLayoutLogger()->info(__VA_ARGS__)
#define LAYOUT_LOG_WARN(...)     ::trellis::Log::getLayoutLogger()->warn(__VA_ARGS__)
#define LAYOUT_LOG_ERROR(...)    ::trellis::Log::getLayoutLogger()->error(__VA_ARGS__)
#define LAYOUT_LOG_CRITICAL(...) ::trellis::Log::getLayoutLogger()->critical(__VA_ARGS__)
