#include "utils/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <vector>

namespace Durak {

std::shared_ptr<spdlog::logger> Logger::resourceLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::stopwordLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::cliLogger = nullptr;
std::once_flag Logger::initFlag;

void Logger::initialize(const std::string& level, const std::string& logDirectory) {
    std::call_once(initFlag, [&]() {
        auto lvl = spdlog::level::from_str(level);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

        if (!logDirectory.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(logDirectory, ec);
            if (ec) {
                std::cerr << "Cannot create log directory " << logDirectory
                          << ": " << ec.message() << std::endl;
            }
        }

        createLogger("resources", logDirectory, lvl, resourceLogger);
        createLogger("stopwords", logDirectory, lvl, stopwordLogger);
        createLogger("cli", logDirectory, lvl, cliLogger);

        // The LOG_* macros re-enter initialize(); log through the logger directly
        resourceLogger->debug("Logging system initialized");
    });
}

void Logger::ensureInitialized() {
    initialize();
}

void Logger::createLogger(
    const std::string& name,
    const std::string& logDirectory,
    spdlog::level::level_enum level,
    std::shared_ptr<spdlog::logger>& logger
) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        // Rotating file sink: 10MB max size, 3 backup files
        if (!logDirectory.empty()) {
            auto filename = (std::filesystem::path(logDirectory) / (name + "_log.txt")).string();
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                filename, 1024 * 1024 * 10, 3
            );
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }

        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed for " << name << ": " << ex.what() << std::endl;
        // Fall back to a sink-less logger so callers never dereference null
        logger = std::make_shared<spdlog::logger>(name);
    }
}

std::shared_ptr<spdlog::logger> Logger::getResourceLogger() {
    ensureInitialized();
    return resourceLogger;
}

std::shared_ptr<spdlog::logger> Logger::getStopwordLogger() {
    ensureInitialized();
    return stopwordLogger;
}

std::shared_ptr<spdlog::logger> Logger::getCliLogger() {
    ensureInitialized();
    return cliLogger;
}

void Logger::shutdown() {
    if (resourceLogger) {
        resourceLogger->flush();
    }
    if (stopwordLogger) {
        stopwordLogger->flush();
    }
    if (cliLogger) {
        cliLogger->flush();
    }

    spdlog::shutdown();
}

} // namespace Durak
