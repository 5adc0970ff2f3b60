#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace Durak {

// Sorted set of normalized words
using WordSet = std::set<std::string>;

/**
 * Load a newline-delimited word file
 *
 * Lines that are blank after trimming, or start with '#', are skipped.
 * Remaining lines are trimmed and case folded unless caseSensitive is set.
 * Throws MissingFileError if the file cannot be opened.
 */
WordSet loadStopwords(const std::filesystem::path& path, bool caseSensitive = false);

} // namespace Durak
