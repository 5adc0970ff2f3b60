#pragma once

#include "utils/WordFile.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Durak {

/**
 * Where and how to resolve named stopword resources
 */
struct ResourceOptions {
    std::optional<std::filesystem::path> metadataPath;  // Unset = configured metadata
    bool caseSensitive = false;
};

// Metadata path to use for the given options
std::filesystem::path metadataPathFor(const ResourceOptions& options);

// Resolve one named resource, applying extends/alias inheritance
WordSet loadStopwordResource(const std::string& resourceName,
                             const ResourceOptions& options = {});

// Resolve and merge several named resources
WordSet loadStopwordResources(const std::vector<std::string>& resourceNames,
                              const ResourceOptions& options = {});

/**
 * Default stopword set: the configured default resource, case folded.
 * Resolved on first use and shared for the rest of the process.
 */
std::shared_ptr<const WordSet> baseStopwords();

/**
 * Word set for a resource selection: no names = default resource,
 * one name = that resource, several = their union.
 */
std::shared_ptr<const WordSet> selectStopwords(const std::vector<std::string>& resourceNames,
                                               const ResourceOptions& options = {});

// True if the token is in the selected stopword set
bool isStopword(const std::string& token,
                const std::vector<std::string>& resourceNames = {},
                const ResourceOptions& options = {});

// Sorted words of the selected stopword set
std::vector<std::string> listStopwords(const std::vector<std::string>& resourceNames = {},
                                       const ResourceOptions& options = {});

} // namespace Durak
