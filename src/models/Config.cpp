#include "models/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <set>

namespace Durak {

std::unique_ptr<Config> Config::instance = nullptr;

namespace {
const std::set<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"
};
}

Config::Config() {
    reset();
}

Config& Config::getInstance() {
    static std::once_flag created;
    std::call_once(created, []() {
        instance = std::unique_ptr<Config>(new Config());
    });
    return *instance;
}

std::filesystem::path Config::defaultMetadataPath() {
    return std::filesystem::path(DURAK_RESOURCE_DIR) / "tr" / "stopwords" / "metadata.json";
}

void Config::reset() {
    metadataPath = defaultMetadataPath();
    defaultResource = "base/turkish";
    logLevel = "info";
    logDirectory.clear();
}

bool Config::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            return false;
        }

        json config;
        file >> config;

        if (!config.is_object()) {
            return false;
        }

        if (config.contains("metadata_path")) {
            std::filesystem::path path = config["metadata_path"].get<std::string>();
            // Relative paths are taken relative to the config file
            if (path.is_relative()) {
                path = std::filesystem::path(filename).parent_path() / path;
            }
            metadataPath = path;
        }
        if (config.contains("default_resource")) {
            defaultResource = config["default_resource"].get<std::string>();
        }
        if (config.contains("log_level")) {
            std::string level = config["log_level"].get<std::string>();
            if (kLogLevels.count(level) == 0) {
                return false;
            }
            logLevel = level;
        }
        if (config.contains("log_directory")) {
            logDirectory = config["log_directory"].get<std::string>();
        }

        return true;
    } catch (const json::exception&) {
        return false;
    }
}

bool Config::loadFromEnvironment() {
    bool found = false;

    std::string value = getEnv("DURAK_METADATA_PATH");
    if (!value.empty()) {
        metadataPath = value;
        found = true;
    }

    value = getEnv("DURAK_DEFAULT_RESOURCE");
    if (!value.empty()) {
        defaultResource = value;
        found = true;
    }

    value = getEnv("DURAK_LOG_LEVEL");
    if (!value.empty() && kLogLevels.count(value) > 0) {
        logLevel = value;
        found = true;
    }

    value = getEnv("DURAK_LOG_DIR");
    if (!value.empty()) {
        logDirectory = value;
        found = true;
    }

    return found;
}

json Config::toJson() const {
    return json{
        {"metadata_path", metadataPath.string()},
        {"default_resource", defaultResource},
        {"log_level", logLevel},
        {"log_directory", logDirectory}
    };
}

std::string Config::getEnv(const std::string& key, const std::string& defaultValue) const {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : defaultValue;
}

} // namespace Durak
