#include "core/Logger.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Kinetic {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
bool Logger::s_initialized = false;

LogSettings LogSettings::FromConfig(const Config& config) {
    LogSettings settings;
    settings.file = config.Get<std::string>("logging.file", settings.file);
    settings.console = config.Get<bool>("logging.console", settings.console);

    const std::string levelName = config.Get<std::string>("logging.level", "info");
    if (auto level = Logger::ParseLevel(levelName)) {
        settings.level = *level;
    } else {
        KINETIC_LOG_WARN("Unknown log level '{}', using {}", levelName,
                         spdlog::level::to_string_view(settings.level));
    }
    return settings;
}

void Logger::Initialize(const LogSettings& settings) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (settings.console) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    if (!settings.file.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, settings.maxFileBytes, settings.maxFiles);
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    s_engineLogger = std::make_shared<spdlog::logger>("KINETIC", sinks.begin(), sinks.end());
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_appLogger);

    SetLevel(settings.level);
    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_appLogger->flush();

    // drop_all() also clears the default logger the getters fall back to
    spdlog::drop_all();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));

    s_engineLogger.reset();
    s_appLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    if (s_engineLogger) {
        s_engineLogger->set_level(level);
    }
    if (s_appLogger) {
        s_appLogger->set_level(level);
    }
}

std::optional<spdlog::level::level_enum> Logger::ParseLevel(std::string_view name) {
    // from_str maps unknown names to off
    const auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::shared_ptr<spdlog::logger> Logger::GetEngineLogger() {
    return s_engineLogger ? s_engineLogger : spdlog::default_logger();
}

std::shared_ptr<spdlog::logger> Logger::GetAppLogger() {
    return s_appLogger ? s_appLogger : spdlog::default_logger();
}

} // namespace Kinetic
