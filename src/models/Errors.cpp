#include "models/Errors.hpp"
#include <utility>

namespace Durak {

namespace {

std::string joinStrings(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace

UnknownResourceError::UnknownResourceError(const std::string& resourceName)
    : StopwordError("Unknown stopword resource '" + resourceName + "'.")
    , name(resourceName) {
}

CycleError::CycleError(std::vector<std::string> chain)
    : StopwordError("Circular stopword resource extends chain: " + joinStrings(chain, " -> "))
    , cycle(std::move(chain)) {
}

PathEscapeError::PathEscapeError(const std::string& relativePath)
    : StopwordError("Stopword resource path '" + relativePath + "' escapes the data directory.")
    , path(relativePath) {
}

MissingFileError::MissingFileError(const std::string& filePath, const std::string& message)
    : StopwordError(message)
    , path(filePath) {
}

AliasConflictError::AliasConflictError(const std::string& resourceName,
                                       const std::vector<std::string>& fields)
    : StopwordError("Stopword alias '" + resourceName
                    + "' cannot define additional fields: " + joinStrings(fields, ", ") + ".")
    , name(resourceName)
    , extraFields(fields) {
}

} // namespace Durak
