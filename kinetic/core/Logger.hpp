#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Kinetic {

class Config;

/**
 * @brief Sink and level selection for the motion loggers
 *
 * Read from the "logging" section of the configuration document.
 */
struct LogSettings {
    std::string file;                                   // empty: no file sink
    bool console = true;
    spdlog::level::level_enum level = spdlog::level::info;
    size_t maxFileBytes = 5 * 1024 * 1024;
    size_t maxFiles = 3;

    /**
     * @brief Read logging.{file,console,level}
     *
     * An unknown level name is reported and the default level kept.
     */
    static LogSettings FromConfig(const Config& config);
};

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two named loggers share the configured sinks: "KINETIC" for the engine and
 * "APP" for hosts. Before Initialize() both resolve to spdlog's default logger,
 * so engines created in tools and tests still log.
 */
class Logger {
public:
    /**
     * @brief Create the engine and application loggers
     *
     * Does nothing when already initialized.
     */
    static void Initialize(const LogSettings& settings = {});

    /**
     * @brief Flush and drop both loggers
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level of both loggers
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace" ... "off")
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

    static std::shared_ptr<spdlog::logger> GetEngineLogger();
    static std::shared_ptr<spdlog::logger> GetAppLogger();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace Kinetic

// Engine logging
#define KINETIC_LOG_TRACE(...)    ::Kinetic::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define KINETIC_LOG_DEBUG(...)    ::Kinetic::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define KINETIC_LOG_INFO(...)     ::Kinetic::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define KINETIC_LOG_WARN(...)     ::Kinetic::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define KINETIC_LOG_ERROR(...)    ::Kinetic::Logger::GetEngineLogger()->error(__VA_ARGS__)

// Host application logging
#define APP_LOG_TRACE(...)    ::Kinetic::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Kinetic::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Kinetic::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Kinetic::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Kinetic::Logger::GetAppLogger()->error(__VA_ARGS__)
