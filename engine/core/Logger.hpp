#pragma once

#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <string>

namespace Quadra {

/**
 * @brief Sink and level setup shared by the engine and app loggers
 */
struct LogSettings {
    std::string file;                                   // Rotating file sink when non-empty
    bool console = true;
    spdlog::level::level_enum level = spdlog::level::info;
    size_t maxFileSize = 5 * 1024 * 1024;
    size_t maxFiles = 3;
};

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two loggers share one set of sinks: "QUADRA" for the library and "APP" for
 * programs built on it. Both come up with default settings on first use if
 * Initialize() was never called.
 */
class Logger {
public:
    /**
     * @brief Create both loggers; ignored if they already exist
     */
    static void Initialize(const LogSettings& settings = {});

    /**
     * @brief Flush and drop both loggers
     */
    static void Shutdown();

    static spdlog::logger& Engine();
    static spdlog::logger& App();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
};

} // namespace Quadra

// Library logging
#define QUADRA_LOG_TRACE(...)    ::Quadra::Logger::Engine().trace(__VA_ARGS__)
#define QUADRA_LOG_DEBUG(...)    ::Quadra::Logger::Engine().debug(__VA_ARGS__)
#define QUADRA_LOG_INFO(...)     ::Quadra::Logger::Engine().info(__VA_ARGS__)
#define QUADRA_LOG_WARN(...)     ::Quadra::Logger::Engine().warn(__VA_ARGS__)
#define QUADRA_LOG_ERROR(...)    ::Quadra::Logger::Engine().error(__VA_ARGS__)
#define QUADRA_LOG_CRITICAL(...) ::Quadra::Logger::Engine().critical(__VA_ARGS__)

// Application logging
#define APP_LOG_TRACE(...)    ::Quadra::Logger::App().trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Quadra::Logger::App().debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Quadra::Logger::App().info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Quadra::Logger::App().warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Quadra::Logger::App().error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Quadra::Logger::App().critical(__VA_ARGS__)
