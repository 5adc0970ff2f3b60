#include "data/ResourcePath.hpp"
#include "models/Errors.hpp"
#include "utils/Logger.hpp"

namespace Durak {

namespace fs = std::filesystem;

bool isWithinDirectory(const fs::path& path, const fs::path& base) {
    auto pathIt = path.begin();
    for (auto baseIt = base.begin(); baseIt != base.end(); ++baseIt) {
        // Trailing separator shows up as an empty element
        if (baseIt->empty()) {
            continue;
        }
        if (pathIt == path.end() || *pathIt != *baseIt) {
            return false;
        }
        ++pathIt;
    }
    return true;
}

fs::path resolveResourcePath(const std::string& relativePath, const fs::path& baseDir) {
    if (relativePath.empty()) {
        throw SchemaError("Stopword resource entry is missing its 'file'.");
    }

    std::error_code ec;
    fs::path baseResolved = fs::weakly_canonical(baseDir, ec);
    if (ec) {
        baseResolved = fs::absolute(baseDir).lexically_normal();
    }

    // Symlinks are followed before the containment check
    fs::path candidate = fs::weakly_canonical(baseResolved / relativePath, ec);
    if (ec) {
        candidate = (baseResolved / relativePath).lexically_normal();
    }

    if (!isWithinDirectory(candidate, baseResolved)) {
        LOG_RES_WARN("Rejected resource path {} (resolves to {})", relativePath, candidate.string());
        throw PathEscapeError(relativePath);
    }

    if (!fs::is_regular_file(candidate, ec)) {
        throw MissingFileError(candidate.string(),
                               "Stopword resource file '" + relativePath
                               + "' not found under '" + baseDir.string() + "'.");
    }

    return candidate;
}

} // namespace Durak
