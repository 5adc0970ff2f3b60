#include "data/Stopwords.hpp"
#include "data/ResourceResolver.hpp"
#include "models/Config.hpp"
#include "utils/TextCase.hpp"

namespace Durak {

std::filesystem::path metadataPathFor(const ResourceOptions& options) {
    if (options.metadataPath) {
        return *options.metadataPath;
    }
    return getConfig().metadataPath;
}

WordSet loadStopwordResource(const std::string& resourceName, const ResourceOptions& options) {
    auto words = getResourceResolver().resolve(resourceName,
                                               metadataPathFor(options),
                                               options.caseSensitive);
    // Callers get their own copy; the cached set stays untouched
    return *words;
}

WordSet loadStopwordResources(const std::vector<std::string>& resourceNames,
                              const ResourceOptions& options) {
    return getResourceResolver().resolveMany(resourceNames,
                                             metadataPathFor(options),
                                             options.caseSensitive);
}

std::shared_ptr<const WordSet> baseStopwords() {
    const auto& config = getConfig();
    return getResourceResolver().resolve(config.defaultResource, config.metadataPath, false);
}

std::shared_ptr<const WordSet> selectStopwords(const std::vector<std::string>& resourceNames,
                                               const ResourceOptions& options) {
    auto& resolver = getResourceResolver();

    if (resourceNames.empty()) {
        if (!options.caseSensitive && !options.metadataPath) {
            return baseStopwords();
        }
        return resolver.resolve(getConfig().defaultResource,
                                metadataPathFor(options),
                                options.caseSensitive);
    }

    if (resourceNames.size() == 1) {
        return resolver.resolve(resourceNames.front(),
                                metadataPathFor(options),
                                options.caseSensitive);
    }

    return std::make_shared<const WordSet>(
        resolver.resolveMany(resourceNames, metadataPathFor(options), options.caseSensitive));
}

bool isStopword(const std::string& token,
                const std::vector<std::string>& resourceNames,
                const ResourceOptions& options) {
    std::string normalized = TextCase::normalize(token, options.caseSensitive);
    if (normalized.empty()) {
        return false;
    }
    auto words = selectStopwords(resourceNames, options);
    return words->count(normalized) > 0;
}

std::vector<std::string> listStopwords(const std::vector<std::string>& resourceNames,
                                       const ResourceOptions& options) {
    auto words = selectStopwords(resourceNames, options);
    // WordSet is ordered, so this is already sorted
    return std::vector<std::string>(words->begin(), words->end());
}

} // namespace Durak
