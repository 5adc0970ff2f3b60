#pragma once

#include <string>
#include <string_view>

namespace Durak {

/**
 * Turkish-aware case folding for UTF-8 text
 *
 * Lowercasing maps 'I' -> 'ı' and 'İ' -> 'i' before the regular
 * Latin/Greek/Cyrillic rules apply. Bytes that are not valid UTF-8 are
 * copied through untouched.
 */
namespace TextCase {

// Lowercase with Turkish dotted/undotted I handling
std::string toLower(std::string_view text);

// Normalize a word the way word sets store it
inline std::string normalize(std::string_view word, bool caseSensitive) {
    return caseSensitive ? std::string(word) : toLower(word);
}

// Strip leading and trailing ASCII whitespace
std::string_view trim(std::string_view text);

} // namespace TextCase

} // namespace Durak
