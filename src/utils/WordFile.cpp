#include "utils/WordFile.hpp"
#include "utils/TextCase.hpp"
#include "models/Errors.hpp"
#include <fstream>

namespace Durak {

WordSet loadStopwords(const std::filesystem::path& path, bool caseSensitive) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw MissingFileError(path.string(),
                               "Failed to load stopwords from '" + path.string() + "'.");
    }

    WordSet entries;
    std::string line;
    while (std::getline(file, line)) {
        std::string_view stripped = TextCase::trim(line);
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }
        entries.insert(TextCase::normalize(stripped, caseSensitive));
    }

    if (file.bad()) {
        throw MissingFileError(path.string(),
                               "Failed reading stopwords from '" + path.string() + "'.");
    }

    return entries;
}

} // namespace Durak
