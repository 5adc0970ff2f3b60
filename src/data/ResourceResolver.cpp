#include "data/ResourceResolver.hpp"
#include "data/ResourcePath.hpp"
#include "models/Errors.hpp"
#include "models/ResourceEntry.hpp"
#include "utils/Logger.hpp"
#include <optional>
#include <utility>

namespace Durak {

namespace fs = std::filesystem;

namespace {

struct Frame {
    std::string name;
    bool expanded = false;
    std::optional<ResourceEntry> entry;
};

} // namespace

ResourceResolver::ResourceResolver()
    : store(std::make_shared<MetadataStore>()) {
}

ResourceResolver::ResourceResolver(std::shared_ptr<MetadataStore> metadataStore)
    : store(std::move(metadataStore)) {
}

std::shared_ptr<const MetadataDocument> ResourceResolver::loadMetadata(const fs::path& metadataPath) {
    return store->load(metadataPath);
}

std::shared_ptr<const WordSet> ResourceResolver::resolve(const std::string& resourceName,
                                                         const fs::path& metadataPath,
                                                         bool caseSensitive) {
    auto document = store->load(metadataPath);

    // One resolution at a time: racing callers wait and then hit the cache
    std::lock_guard<std::mutex> lock(mutex);

    try {
        return resolveLocked(*document, resourceName, caseSensitive);
    } catch (const StopwordError& e) {
        LOG_RES_WARN("Failed to resolve stopword resource '{}': {}", resourceName, e.what());
        throw;
    }
}

WordSet ResourceResolver::resolveMany(const std::vector<std::string>& resourceNames,
                                      const fs::path& metadataPath,
                                      bool caseSensitive) {
    WordSet merged;
    for (const auto& name : resourceNames) {
        auto words = resolve(name, metadataPath, caseSensitive);
        merged.insert(words->begin(), words->end());
    }
    return merged;
}

bool ResourceResolver::isCached(const std::string& resourceName,
                                const fs::path& metadataPath,
                                bool caseSensitive) const {
    CacheKey key{MetadataStore::canonicalKey(metadataPath).string(), resourceName, caseSensitive};
    std::lock_guard<std::mutex> lock(mutex);
    return resolved.count(key) > 0;
}

std::size_t ResourceResolver::cachedSetCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return resolved.size();
}

std::shared_ptr<const WordSet> ResourceResolver::resolveLocked(const MetadataDocument& document,
                                                               const std::string& resourceName,
                                                               bool caseSensitive) {
    const std::string documentKey = document.path.string();
    auto keyFor = [&](const std::string& name) {
        return CacheKey{documentKey, name, caseSensitive};
    };

    auto cached = resolved.find(keyFor(resourceName));
    if (cached != resolved.end()) {
        LOG_RES_DEBUG("Cache hit for '{}' (case_sensitive={})", resourceName, caseSensitive);
        return cached->second;
    }

    std::map<std::string, VisitState> states;
    std::vector<std::string> chain;   // Names currently in progress, outermost first
    std::vector<Frame> work;
    work.push_back(Frame{resourceName});

    while (!work.empty()) {
        if (!work.back().expanded) {
            const std::string name = work.back().name;

            if (resolved.count(keyFor(name)) > 0) {
                work.pop_back();
                continue;
            }

            if (states[name] == VisitState::InProgress) {
                std::vector<std::string> cycle = chain;
                cycle.push_back(name);
                throw CycleError(cycle);
            }

            if (!document.hasResource(name)) {
                throw UnknownResourceError(name);
            }

            // Also rejects alias entries that declare other fields
            ResourceEntry entry = ResourceEntry::fromJson(name, document.sets.at(name));

            std::vector<std::string> dependencies =
                entry.isAlias() ? std::vector<std::string>{*entry.alias} : entry.extends;

            states[name] = VisitState::InProgress;
            chain.push_back(name);
            work.back().expanded = true;
            work.back().entry = std::move(entry);

            // Reverse so the first declared parent is resolved first
            for (auto it = dependencies.rbegin(); it != dependencies.rend(); ++it) {
                work.push_back(Frame{*it});
            }
            continue;
        }

        // Every dependency of this frame is now in the cache
        Frame frame = std::move(work.back());
        work.pop_back();
        const ResourceEntry& entry = *frame.entry;

        std::shared_ptr<const WordSet> result;
        if (entry.isAlias()) {
            result = resolved.at(keyFor(*entry.alias));
        } else {
            auto words = std::make_shared<WordSet>();
            for (const auto& parent : entry.extends) {
                const auto& parentWords = resolved.at(keyFor(parent));
                words->insert(parentWords->begin(), parentWords->end());
            }
            if (entry.file) {
                fs::path filePath = resolveResourcePath(*entry.file, document.baseDir);
                WordSet fileWords = loadStopwords(filePath, caseSensitive);
                words->insert(fileWords.begin(), fileWords.end());
            }
            result = std::move(words);
        }

        states[frame.name] = VisitState::Resolved;
        chain.pop_back();
        resolved.emplace(keyFor(frame.name), result);

        LOG_RES_DEBUG("Resolved stopword resource '{}' ({} words, case_sensitive={})",
                      frame.name, result->size(), caseSensitive);
    }

    return resolved.at(keyFor(resourceName));
}

ResourceResolver& getResourceResolver() {
    // Function-local static: initialization is thread-safe
    static ResourceResolver globalResolver;
    return globalResolver;
}

} // namespace Durak
