#pragma once

#include "data/Stopwords.hpp"
#include "utils/WordFile.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Durak {

using json = nlohmann::json;

/**
 * Immutable point-in-time copy of a StopwordManager's state
 */
class StopwordSnapshot {
public:
    StopwordSnapshot(WordSet stopwords, WordSet keepWords, bool caseSensitive);

    const WordSet& stopwords() const { return stopwordSet; }
    const WordSet& keepWords() const { return keepSet; }
    bool caseSensitive() const { return sensitive; }

    json toJson() const;

private:
    WordSet stopwordSet;
    WordSet keepSet;
    bool sensitive;
};

/**
 * Mutable stopword set with a keep-list override
 *
 * Words in the keep-list are never reported as stopwords and never enter
 * the stopword set while they are kept. Not safe for concurrent mutation;
 * share snapshots across threads instead.
 */
class StopwordManager {
public:
    struct Options {
        std::optional<WordSet> base;          // Unset = baseStopwords()
        std::vector<std::string> additions;
        std::vector<std::string> keep;
        bool caseSensitive = false;
    };

    StopwordManager();
    explicit StopwordManager(const Options& options);

    // Queries
    bool isStopword(const std::string& token) const;
    const WordSet& stopwords() const { return stopwordSet; }
    const WordSet& keepWords() const { return keepSet; }
    bool isCaseSensitive() const { return caseSensitive; }

    // Mutation
    void add(const std::vector<std::string>& words);
    void remove(const std::vector<std::string>& words);
    void addKeepWords(const std::vector<std::string>& words);
    void loadAdditions(const std::filesystem::path& path);

    // Write sorted stopwords ("txt" or "json"); keep-words are not exported
    void exportTo(const std::filesystem::path& path, const std::string& format = "txt") const;

    StopwordSnapshot snapshot() const;
    json toJson() const;

    // Factories
    static StopwordManager fromFiles(const std::vector<std::filesystem::path>& additionFiles,
                                     const std::vector<std::filesystem::path>& keepFiles = {},
                                     bool caseSensitive = false);

    // Base set = union of the named resources (default resource when empty)
    static StopwordManager fromResources(const std::vector<std::string>& resourceNames,
                                         const ResourceOptions& resources = {},
                                         const std::vector<std::string>& additions = {},
                                         const std::vector<std::string>& keep = {});

private:
    WordSet stopwordSet;
    WordSet keepSet;
    bool caseSensitive;

    std::string normalize(const std::string& word) const;
    void addWord(const std::string& word);
    void keepWord(const std::string& word);
};

/**
 * Options for removeStopwords: either a shared manager or ad hoc settings
 */
struct FilterOptions {
    const StopwordManager* manager = nullptr;
    std::optional<WordSet> base;
    std::optional<std::vector<std::string>> additions;
    std::optional<std::vector<std::string>> keep;
    std::optional<bool> caseSensitive;
};

/**
 * Return the tokens that are not stopwords, in their original order.
 * Throws ConfigurationError when a manager is combined with base/additions/keep
 * or with a different case mode.
 */
std::vector<std::string> removeStopwords(const std::vector<std::string>& tokens,
                                         const FilterOptions& options = {});

} // namespace Durak
