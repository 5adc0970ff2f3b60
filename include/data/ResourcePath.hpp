#pragma once

#include <filesystem>
#include <string>

namespace Durak {

/**
 * Resolve a resource file reference against the metadata directory.
 *
 * The result is canonical and must lie under baseDir. Throws SchemaError
 * for an empty reference, PathEscapeError when the reference leaves
 * baseDir, MissingFileError when the target is not a regular file.
 */
std::filesystem::path resolveResourcePath(const std::string& relativePath,
                                          const std::filesystem::path& baseDir);

// True when path equals base or lies beneath it (both already normalized)
bool isWithinDirectory(const std::filesystem::path& path, const std::filesystem::path& base);

} // namespace Durak
