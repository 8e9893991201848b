#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

/**
 * Lowercase a string (ASCII only, other bytes are copied unchanged)
 */
inline std::string toLower(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/**
 * Trim whitespace from both ends of string
 */
inline std::string trim(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return std::string{str.substr(start, end - start + 1)};
}

/**
 * Split on runs of spaces/tabs, dropping empty fields
 */
inline std::vector<std::string> splitWhitespace(std::string_view str) {
    std::vector<std::string> fields;
    size_t pos = 0;
    while (pos < str.size()) {
        size_t start = str.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) {
            break;
        }
        size_t end = str.find_first_of(" \t", start);
        if (end == std::string_view::npos) {
            end = str.size();
        }
        fields.emplace_back(str.substr(start, end - start));
        pos = end;
    }
    return fields;
}

// Letters, digits, underscore, and bytes >= 0x80 (parts of UTF-8 letters)
inline bool isWordChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || u == '_';
}

inline bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

} // namespace utils

#endif // STRING_UTILS_HPP
