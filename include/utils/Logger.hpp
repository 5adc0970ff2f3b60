#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <string>

namespace Durak {

/**
 * Logger utility class
 * Named loggers for resource resolution, stopword management and the CLI.
 * Console output goes to stderr so stdout stays free for word lists.
 */
class Logger {
public:
    // Initialize logging system (level name as understood by spdlog)
    static void initialize(const std::string& level = "info",
                           const std::string& logDirectory = "");

    // Get loggers
    static std::shared_ptr<spdlog::logger> getResourceLogger();
    static std::shared_ptr<spdlog::logger> getStopwordLogger();
    static std::shared_ptr<spdlog::logger> getCliLogger();

    // Shutdown logging system
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> resourceLogger;
    static std::shared_ptr<spdlog::logger> stopwordLogger;
    static std::shared_ptr<spdlog::logger> cliLogger;
    static std::once_flag initFlag;

    static void ensureInitialized();
    static void createLogger(
        const std::string& name,
        const std::string& logDirectory,
        spdlog::level::level_enum level,
        std::shared_ptr<spdlog::logger>& logger
    );
};

// Convenience macros
#define LOG_RES_INFO(...)    Durak::Logger::getResourceLogger()->info(__VA_ARGS__)
#define LOG_RES_WARN(...)    Durak::Logger::getResourceLogger()->warn(__VA_ARGS__)
#define LOG_RES_ERROR(...)   Durak::Logger::getResourceLogger()->error(__VA_ARGS__)
#define LOG_RES_DEBUG(...)   Durak::Logger::getResourceLogger()->debug(__VA_ARGS__)

#define LOG_SW_INFO(...)     Durak::Logger::getStopwordLogger()->info(__VA_ARGS__)
#define LOG_SW_WARN(...)     Durak::Logger::getStopwordLogger()->warn(__VA_ARGS__)
#define LOG_SW_DEBUG(...)    Durak::Logger::getStopwordLogger()->debug(__VA_ARGS__)

#define LOG_CLI_INFO(...)    Durak::Logger::getCliLogger()->info(__VA_ARGS__)
#define LOG_CLI_ERROR(...)   Durak::Logger::getCliLogger()->error(__VA_ARGS__)

} // namespace Durak
