#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace Durak {

/**
 * Base exception for all Durak errors
 */
class DurakError : public std::runtime_error {
public:
    explicit DurakError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Invalid or conflicting configuration
 * (unsupported export format, manager plus ad hoc word lists, ...)
 */
class ConfigurationError : public DurakError {
public:
    using DurakError::DurakError;
};

/**
 * Stopword resource loading or resolution failed
 */
class StopwordError : public DurakError {
public:
    using DurakError::DurakError;
};

/**
 * Metadata document is missing, malformed, or declares an invalid entry
 */
class SchemaError : public StopwordError {
public:
    using StopwordError::StopwordError;
};

/**
 * Resource name is not declared in the metadata 'sets' map
 */
class UnknownResourceError : public StopwordError {
public:
    explicit UnknownResourceError(const std::string& resourceName);

    const std::string& resourceName() const { return name; }

private:
    std::string name;
};

/**
 * extends/alias chain loops back on itself
 */
class CycleError : public StopwordError {
public:
    explicit CycleError(std::vector<std::string> chain);

    const std::vector<std::string>& chain() const { return cycle; }

private:
    std::vector<std::string> cycle;
};

/**
 * Resource file reference resolves outside the metadata directory
 */
class PathEscapeError : public StopwordError {
public:
    explicit PathEscapeError(const std::string& relativePath);

    const std::string& relativePath() const { return path; }

private:
    std::string path;
};

/**
 * Word file does not exist or is not a regular file
 */
class MissingFileError : public StopwordError {
public:
    MissingFileError(const std::string& filePath, const std::string& message);

    const std::string& filePath() const { return path; }

private:
    std::string path;
};

/**
 * Alias entry also declares fields other than 'description'
 */
class AliasConflictError : public StopwordError {
public:
    AliasConflictError(const std::string& resourceName,
                       const std::vector<std::string>& fields);

    const std::string& resourceName() const { return name; }
    const std::vector<std::string>& fields() const { return extraFields; }

private:
    std::string name;
    std::vector<std::string> extraFields;
};

} // namespace Durak
