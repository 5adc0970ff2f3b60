#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <nlohmann/json.hpp>

#ifndef DURAK_RESOURCE_DIR
#define DURAK_RESOURCE_DIR "resources"
#endif

namespace Durak {

using json = nlohmann::json;

/**
 * Configuration management class
 * Loads configuration from JSON file and environment variables
 */
class Config {
public:
    // Resources
    std::filesystem::path metadataPath;   // Stopword metadata document
    std::string defaultResource;          // Used when no resource is named

    // Logging
    std::string logLevel;                 // trace, debug, info, warn, error, off
    std::string logDirectory;             // Empty = console only

    // Singleton pattern
    static Config& getInstance();

    // Load configuration
    bool loadFromFile(const std::string& filename);
    bool loadFromEnvironment();

    // Restore built-in defaults
    void reset();

    json toJson() const;

    static std::filesystem::path defaultMetadataPath();

    ~Config() = default;

private:
    Config();

    // Prevent copying
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Helper methods
    std::string getEnv(const std::string& key, const std::string& defaultValue = "") const;

    static std::unique_ptr<Config> instance;
};

/**
 * Get global configuration instance
 */
inline Config& getConfig() {
    return Config::getInstance();
}

} // namespace Durak
