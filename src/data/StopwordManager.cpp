#include "data/StopwordManager.hpp"
#include "models/Config.hpp"
#include "models/Errors.hpp"
#include "utils/TextCase.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <utility>

namespace Durak {

namespace fs = std::filesystem;

StopwordSnapshot::StopwordSnapshot(WordSet stopwords, WordSet keepWords, bool caseSensitive)
    : stopwordSet(std::move(stopwords))
    , keepSet(std::move(keepWords))
    , sensitive(caseSensitive) {
}

json StopwordSnapshot::toJson() const {
    return json{
        {"stopwords", stopwordSet},
        {"keep_words", keepSet},
        {"case_sensitive", sensitive}
    };
}

StopwordManager::StopwordManager()
    : StopwordManager(Options{}) {
}

StopwordManager::StopwordManager(const Options& options)
    : caseSensitive(options.caseSensitive) {
    if (options.base) {
        for (const auto& word : *options.base) {
            stopwordSet.insert(normalize(word));
        }
    } else {
        auto base = baseStopwords();
        for (const auto& word : *base) {
            stopwordSet.insert(normalize(word));
        }
    }

    add(options.additions);
    addKeepWords(options.keep);
}

std::string StopwordManager::normalize(const std::string& word) const {
    return TextCase::normalize(word, caseSensitive);
}

bool StopwordManager::isStopword(const std::string& token) const {
    std::string normalized = normalize(token);
    if (normalized.empty() || keepSet.count(normalized) > 0) {
        return false;
    }
    return stopwordSet.count(normalized) > 0;
}

void StopwordManager::addWord(const std::string& word) {
    std::string normalized = normalize(word);
    if (!normalized.empty() && keepSet.count(normalized) == 0) {
        stopwordSet.insert(std::move(normalized));
    }
}

void StopwordManager::keepWord(const std::string& word) {
    std::string normalized = normalize(word);
    if (normalized.empty()) {
        return;
    }
    stopwordSet.erase(normalized);
    keepSet.insert(std::move(normalized));
}

void StopwordManager::add(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        addWord(word);
    }
}

void StopwordManager::remove(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        stopwordSet.erase(normalize(word));
    }
}

void StopwordManager::addKeepWords(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        keepWord(word);
    }
}

void StopwordManager::loadAdditions(const fs::path& path) {
    WordSet words = loadStopwords(path, caseSensitive);
    for (const auto& word : words) {
        addWord(word);
    }
    LOG_SW_DEBUG("Loaded {} additions from {}", words.size(), path.string());
}

void StopwordManager::exportTo(const fs::path& path, const std::string& format) const {
    if (format != "txt" && format != "json") {
        throw ConfigurationError("Unsupported fmt '" + format + "'; use 'txt' or 'json'.");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StopwordError("Cannot write stopwords to '" + path.string() + "'.");
    }

    if (format == "txt") {
        if (stopwordSet.empty()) {
            file << '\n';
        }
        for (const auto& word : stopwordSet) {
            file << word << '\n';
        }
    } else {
        file << json(stopwordSet).dump(2) << '\n';
    }

    file.flush();
    if (!file) {
        throw StopwordError("Failed writing stopwords to '" + path.string() + "'.");
    }

    LOG_SW_INFO("Exported {} stopwords to {} ({})", stopwordSet.size(), path.string(), format);
}

StopwordSnapshot StopwordManager::snapshot() const {
    return StopwordSnapshot(stopwordSet, keepSet, caseSensitive);
}

json StopwordManager::toJson() const {
    return snapshot().toJson();
}

StopwordManager StopwordManager::fromFiles(const std::vector<fs::path>& additionFiles,
                                           const std::vector<fs::path>& keepFiles,
                                           bool caseSensitive) {
    Options options;
    options.caseSensitive = caseSensitive;
    StopwordManager manager(options);

    for (const auto& path : additionFiles) {
        manager.loadAdditions(path);
    }
    for (const auto& path : keepFiles) {
        WordSet keepWords = loadStopwords(path, caseSensitive);
        manager.addKeepWords(std::vector<std::string>(keepWords.begin(), keepWords.end()));
    }
    return manager;
}

StopwordManager StopwordManager::fromResources(const std::vector<std::string>& resourceNames,
                                               const ResourceOptions& resources,
                                               const std::vector<std::string>& additions,
                                               const std::vector<std::string>& keep) {
    std::vector<std::string> names = resourceNames;
    if (names.empty()) {
        names.push_back(getConfig().defaultResource);
    }

    Options options;
    options.base = loadStopwordResources(names, resources);
    options.additions = additions;
    options.keep = keep;
    options.caseSensitive = resources.caseSensitive;

    LOG_SW_DEBUG("Manager seeded from {} resource(s), {} base words",
                 names.size(), options.base->size());
    return StopwordManager(options);
}

std::vector<std::string> removeStopwords(const std::vector<std::string>& tokens,
                                         const FilterOptions& options) {
    std::optional<StopwordManager> adHoc;
    const StopwordManager* manager = options.manager;

    if (manager == nullptr) {
        StopwordManager::Options managerOptions;
        managerOptions.base = options.base;
        managerOptions.additions = options.additions.value_or(std::vector<std::string>{});
        managerOptions.keep = options.keep.value_or(std::vector<std::string>{});
        managerOptions.caseSensitive = options.caseSensitive.value_or(false);
        adHoc.emplace(managerOptions);
        manager = &*adHoc;
    } else {
        if (options.caseSensitive && *options.caseSensitive != manager->isCaseSensitive()) {
            throw ConfigurationError("Provided case_sensitive does not match the supplied manager.");
        }
        if (options.base || options.additions || options.keep) {
            throw ConfigurationError(
                "Cannot provide base/additions/keep when a manager instance is supplied.");
        }
    }

    std::vector<std::string> filtered;
    for (const auto& token : tokens) {
        if (!manager->isStopword(token)) {
            filtered.push_back(token);
        }
    }
    return filtered;
}

} // namespace Durak
