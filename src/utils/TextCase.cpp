#include "utils/TextCase.hpp"
#include <cstdint>

namespace Durak {
namespace TextCase {

namespace {

// Decode one UTF-8 sequence starting at p. Returns its length, or 0 when
// the bytes do not form a valid scalar value.
size_t decodeOne(const unsigned char* p, const unsigned char* end, char32_t& cp) {
    unsigned char c0 = p[0];

    if (c0 < 0x80) {
        cp = c0;
        return 1;
    }

    size_t length = 0;
    uint32_t value = 0;
    uint32_t minimum = 0;

    if ((c0 >> 5) == 0x6) {
        // 110xxxxx 10xxxxxx
        length = 2;
        value = c0 & 0x1F;
        minimum = 0x80;
    } else if ((c0 >> 4) == 0xE) {
        // 1110xxxx 10xxxxxx 10xxxxxx
        length = 3;
        value = c0 & 0x0F;
        minimum = 0x800;
    } else if ((c0 >> 3) == 0x1E) {
        // 11110xxx 10xxxxxx 10xxxxxx 10xxxxxx
        length = 4;
        value = c0 & 0x07;
        minimum = 0x10000;
    } else {
        return 0;
    }

    if (static_cast<size_t>(end - p) < length) {
        return 0;
    }

    for (size_t i = 1; i < length; ++i) {
        if ((p[i] & 0xC0) != 0x80) {
            return 0;
        }
        value = (value << 6) | (p[i] & 0x3F);
    }

    if (value < minimum || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return 0;
    }

    cp = static_cast<char32_t>(value);
    return length;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

char32_t lowerCodePoint(char32_t cp) {
    // Turkish I first: dotless capital I and dotted capital I
    if (cp == U'I') return U'ı';
    if (cp == U'İ') return U'i';

    if (cp >= U'A' && cp <= U'Z') return cp + 32;
    if (cp < 0x80) return cp;

    // Latin-1 Supplement (skip multiplication sign)
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 32;

    // Latin Extended-A
    if (cp >= 0x100 && cp <= 0x137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x139 && cp <= 0x148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x14A && cp <= 0x177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x178) return 0xFF;
    if (cp >= 0x179 && cp <= 0x17E) return (cp % 2 == 1) ? cp + 1 : cp;

    // Greek
    if (cp == 0x386) return 0x3AC;
    if (cp >= 0x388 && cp <= 0x38A) return cp + 37;
    if (cp == 0x38C) return 0x3CC;
    if (cp >= 0x38E && cp <= 0x38F) return cp + 63;
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) return cp + 32;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 80;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 32;
    if (cp >= 0x460 && cp <= 0x481) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x48A && cp <= 0x4BF) return (cp % 2 == 0) ? cp + 1 : cp;

    return cp;
}

} // namespace

std::string toLower(std::string_view text) {
    std::string result;
    result.reserve(text.size());

    const unsigned char* p = reinterpret_cast<const unsigned char*>(text.data());
    const unsigned char* end = p + text.size();

    while (p < end) {
        char32_t cp = 0;
        size_t length = decodeOne(p, end, cp);
        if (length == 0) {
            result += static_cast<char>(*p);
            ++p;
            continue;
        }
        appendUtf8(result, lowerCodePoint(cp));
        p += length;
    }

    return result;
}

std::string_view trim(std::string_view text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace TextCase
} // namespace Durak
