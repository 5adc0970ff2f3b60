#pragma once

#include "data/MetadataStore.hpp"
#include "utils/WordFile.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace Durak {

/**
 * Stopword resource graph resolver
 *
 * Resolves a named resource to its effective word set by following
 * 'extends' (union of parents plus the entry's own file) and 'alias'
 * (pure redirect). Results are immutable and memoized per
 * (metadata document, resource name, case mode); a failed resolution
 * never leaves partial entries behind.
 *
 * Resolution runs on an explicit work stack, so graph depth is not
 * bounded by the call stack. All public methods are thread-safe.
 */
class ResourceResolver {
public:
    ResourceResolver();
    explicit ResourceResolver(std::shared_ptr<MetadataStore> metadataStore);

    // Resolve one resource. Throws StopwordError subclasses.
    std::shared_ptr<const WordSet> resolve(const std::string& resourceName,
                                           const std::filesystem::path& metadataPath,
                                           bool caseSensitive = false);

    // Resolve several resources and merge them
    WordSet resolveMany(const std::vector<std::string>& resourceNames,
                        const std::filesystem::path& metadataPath,
                        bool caseSensitive = false);

    std::shared_ptr<const MetadataDocument> loadMetadata(const std::filesystem::path& metadataPath);

    // Cache introspection
    bool isCached(const std::string& resourceName,
                  const std::filesystem::path& metadataPath,
                  bool caseSensitive) const;
    std::size_t cachedSetCount() const;

private:
    enum class VisitState {
        Unvisited,
        InProgress,
        Resolved
    };

    // (document path, resource name, case sensitive)
    using CacheKey = std::tuple<std::string, std::string, bool>;

    std::shared_ptr<MetadataStore> store;
    std::map<CacheKey, std::shared_ptr<const WordSet>> resolved;
    mutable std::mutex mutex;

    std::shared_ptr<const WordSet> resolveLocked(const MetadataDocument& document,
                                                 const std::string& resourceName,
                                                 bool caseSensitive);
};

/**
 * Get global resolver instance (created on first use)
 */
ResourceResolver& getResourceResolver();

} // namespace Durak
