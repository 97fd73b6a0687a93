#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

// Splits on the delimiter and trims each piece. Empty pieces are dropped.
inline std::vector<std::string> splitTrimmed(std::string_view s, char delimiter) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const size_t pos = s.find(delimiter, start);
        const size_t end = (pos == std::string_view::npos) ? s.size() : pos;
        std::string piece = trim(s.substr(start, end - start));
        if (!piece.empty()) out.push_back(std::move(piece));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

// Uppercases and keeps only A, T, G and C.
inline std::string normalizeNucleotides(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        const char up = static_cast<char>(std::toupper(c));
        if (up == 'A' || up == 'T' || up == 'G' || up == 'C') out.push_back(up);
    }
    return out;
}

} // namespace CommonUtils
