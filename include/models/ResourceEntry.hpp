#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace Durak {

using json = nlohmann::json;

/**
 * One declaration from the metadata 'sets' map
 */
struct ResourceEntry {
    std::string name;
    std::optional<std::string> file;        // Relative to the metadata directory
    std::vector<std::string> extends;       // Parent resources (order irrelevant)
    std::optional<std::string> alias;       // Pure redirect to another resource
    std::optional<std::string> description;
    std::vector<std::string> fields;        // Every key present in the declaration

    bool isAlias() const { return alias.has_value(); }

    // Keys other than 'alias' and 'description', sorted
    std::vector<std::string> nonAliasFields() const;

    // Throws AliasConflictError when an alias declares other fields,
    // SchemaError when a field has the wrong type or the entry declares
    // none of file/extends/alias
    static ResourceEntry fromJson(const std::string& name, const json& j);
};

} // namespace Durak
