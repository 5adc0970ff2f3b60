#include "models/ResourceEntry.hpp"
#include "models/Errors.hpp"
#include "utils/TextCase.hpp"
#include <algorithm>

namespace Durak {

std::vector<std::string> ResourceEntry::nonAliasFields() const {
    std::vector<std::string> result;
    for (const auto& field : fields) {
        if (field != "alias" && field != "description") {
            result.push_back(field);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

ResourceEntry ResourceEntry::fromJson(const std::string& name, const json& j) {
    if (!j.is_object()) {
        throw SchemaError("Stopword resource '" + name + "' must be a JSON object.");
    }

    ResourceEntry entry;
    entry.name = name;
    for (const auto& item : j.items()) {
        entry.fields.push_back(item.key());
    }

    if (j.contains("alias") && !j["alias"].is_null()) {
        if (!j["alias"].is_string()) {
            throw SchemaError("Stopword resource 'alias' must be a string.");
        }
        std::string target = j["alias"].get<std::string>();
        if (TextCase::trim(target).empty()) {
            throw SchemaError("Stopword resource '" + name + "' alias cannot be empty.");
        }
        entry.alias = target;

        auto extra = entry.nonAliasFields();
        if (!extra.empty()) {
            throw AliasConflictError(name, extra);
        }
    }

    if (j.contains("file") && !j["file"].is_null()) {
        if (!j["file"].is_string() || j["file"].get<std::string>().empty()) {
            throw SchemaError("Stopword resource '" + name + "' is missing its 'file'.");
        }
        entry.file = j["file"].get<std::string>();
    }

    if (j.contains("extends") && !j["extends"].is_null()) {
        const auto& parents = j["extends"];
        if (parents.is_string()) {
            entry.extends.push_back(parents.get<std::string>());
        } else if (parents.is_array()) {
            for (const auto& parent : parents) {
                if (!parent.is_string()) {
                    throw SchemaError("Stopword resource 'extends' must only contain strings.");
                }
                entry.extends.push_back(parent.get<std::string>());
            }
        } else {
            throw SchemaError("Stopword resource 'extends' must be a sequence of strings.");
        }
    }

    if (j.contains("description") && j["description"].is_string()) {
        entry.description = j["description"].get<std::string>();
    }

    if (!entry.alias && !entry.file && entry.extends.empty()) {
        throw SchemaError("Stopword resource '" + name
                          + "' must declare at least one of 'file', 'extends' or 'alias'.");
    }

    return entry;
}

} // namespace Durak
