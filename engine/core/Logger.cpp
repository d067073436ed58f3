#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Quadra {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;

namespace {

std::vector<spdlog::sink_ptr> MakeSinks(const LogSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;

    if (settings.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(std::move(console));
    }

    if (!settings.file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, settings.maxFileSize, settings.maxFiles);
        file->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(std::move(file));
    }

    return sinks;
}

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name,
                                           const std::vector<spdlog::sink_ptr>& sinks,
                                           spdlog::level::level_enum level) {
    // A stale registration survives if Shutdown() was skipped
    spdlog::drop(name);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::Initialize(const LogSettings& settings) {
    if (s_engineLogger) {
        return;
    }

    const auto sinks = MakeSinks(settings);
    s_engineLogger = MakeLogger("QUADRA", sinks, settings.level);
    s_appLogger = MakeLogger("APP", sinks, settings.level);
}

void Logger::Shutdown() {
    if (!s_engineLogger) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();

    spdlog::drop("QUADRA");
    spdlog::drop("APP");

    s_engineLogger.reset();
    s_appLogger.reset();
}

spdlog::logger& Logger::Engine() {
    if (!s_engineLogger) {
        Initialize();
    }
    return *s_engineLogger;
}

spdlog::logger& Logger::App() {
    if (!s_appLogger) {
        Initialize();
    }
    return *s_appLogger;
}

} // namespace Quadra
