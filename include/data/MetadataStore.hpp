#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace Durak {

using json = nlohmann::json;

/**
 * Validated stopword metadata document
 */
struct MetadataDocument {
    std::filesystem::path path;      // Absolute, normalized
    std::filesystem::path baseDir;   // Directory holding the document
    json sets;                       // Non-empty object: name -> entry

    bool hasResource(const std::string& name) const { return sets.contains(name); }
    std::size_t resourceCount() const { return sets.size(); }
};

/**
 * Metadata document loader
 * Parses and validates documents, caching them per absolute path for the
 * lifetime of the store. Safe to call from several threads.
 */
class MetadataStore {
public:
    MetadataStore() = default;

    // Load (or return the cached) document. Throws SchemaError.
    std::shared_ptr<const MetadataDocument> load(const std::filesystem::path& metadataPath);

    // Normalized absolute form used as the cache key
    static std::filesystem::path canonicalKey(const std::filesystem::path& metadataPath);

    std::size_t cachedCount() const;

private:
    std::map<std::string, std::shared_ptr<const MetadataDocument>> documents;
    mutable std::mutex mutex;

    static std::shared_ptr<const MetadataDocument> parse(const std::filesystem::path& resolved);
};

} // namespace Durak
