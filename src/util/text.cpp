#include "util/text.hpp"
#include <mupdf/fitz.h>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace ds {

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::string utf8_prefix(const std::string& text, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos]);
        if ((c & 0xC0) != 0x80) {
            if (chars == max_chars) break;
            chars++;
        }
        pos++;
    }
    return text.substr(0, pos);
}

namespace {

// ASCII whitespace, the 0x1C-0x1F separators and the Unicode space separators
bool is_space_rune(int rune) {
    if (rune < 0x80) {
        return (rune >= 0x09 && rune <= 0x0D) || (rune >= 0x1C && rune <= 0x20);
    }
    if (rune >= 0x2000 && rune <= 0x200A) {
        return true;
    }
    switch (rune) {
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

bool is_blank(const std::string& text) {
    return trim(text).empty();
}

std::string trim(const std::string& text) {
    const char* data = text.c_str();
    size_t start = text.size();
    size_t end = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        int rune = 0;
        size_t len = static_cast<size_t>(fz_chartorune(&rune, data + pos));
        if (!is_space_rune(rune)) {
            if (start == text.size()) start = pos;
            end = pos + len;
        }
        pos += len;
    }
    if (start == text.size()) {
        return "";
    }
    return text.substr(start, end - start);
}

std::string to_lower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

double round1(double value) {
    return std::round(value * 10.0) / 10.0;
}

std::string file_name_of(const std::string& path) {
    size_t last_slash = path.find_last_of("/\\");
    if (last_slash == std::string::npos) {
        return path;
    }
    return path.substr(last_slash + 1);
}

} // namespace ds
