#include "data/MetadataStore.hpp"
#include "models/Errors.hpp"
#include "utils/Logger.hpp"
#include <fstream>

namespace Durak {

namespace fs = std::filesystem;

fs::path MetadataStore::canonicalKey(const fs::path& metadataPath) {
    std::error_code ec;
    fs::path absolute = fs::absolute(metadataPath, ec);
    if (ec) {
        absolute = metadataPath;
    }
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        resolved = absolute.lexically_normal();
    }
    return resolved;
}

std::shared_ptr<const MetadataDocument> MetadataStore::load(const fs::path& metadataPath) {
    fs::path resolved = canonicalKey(metadataPath);
    std::string key = resolved.string();

    // Held across parsing so racing callers never load the same path twice
    std::lock_guard<std::mutex> lock(mutex);

    auto it = documents.find(key);
    if (it != documents.end()) {
        return it->second;
    }

    auto document = parse(resolved);
    documents.emplace(key, document);

    LOG_RES_INFO("Loaded stopword metadata {} ({} sets)", key, document->resourceCount());
    return document;
}

std::size_t MetadataStore::cachedCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return documents.size();
}

std::shared_ptr<const MetadataDocument> MetadataStore::parse(const fs::path& resolved) {
    std::ifstream file(resolved);
    if (!file.is_open() || fs::is_directory(resolved)) {
        throw SchemaError("Stopword metadata file not found at '" + resolved.string() + "'.");
    }

    json data;
    try {
        file >> data;
    } catch (const json::parse_error& e) {
        LOG_RES_DEBUG("Metadata parse error: {}", e.what());
        throw SchemaError("Stopword metadata at '" + resolved.string() + "' is not valid JSON.");
    }

    if (!data.is_object()) {
        throw SchemaError("Stopword metadata must be a JSON object.");
    }

    auto sets = data.find("sets");
    if (sets == data.end() || !sets->is_object() || sets->empty()) {
        throw SchemaError("Stopword metadata 'sets' must be a non-empty map.");
    }

    auto document = std::make_shared<MetadataDocument>();
    document->path = resolved;
    document->baseDir = resolved.parent_path();
    document->sets = *sets;
    return document;
}

} // namespace Durak
