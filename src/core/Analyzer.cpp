#include "sentiment/Analyzer.hpp"

#include <cctype>

namespace sentiment {

std::size_t Analyzer::whitespaceLength(const std::string& text, std::size_t pos) {
    auto at = [&text](std::size_t i) -> unsigned char {
        return i < text.size() ? static_cast<unsigned char>(text[i]) : 0;
    };

    unsigned char b0 = at(pos);
    if ((b0 >= 0x09 && b0 <= 0x0D) || (b0 >= 0x1C && b0 <= 0x20)) return 1;

    unsigned char b1 = at(pos + 1);
    if (b0 == 0xC2) {
        // U+0085 NEL, U+00A0 NBSP
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    }

    unsigned char b2 = at(pos + 2);
    if (b0 == 0xE1) {
        // U+1680 OGHAM SPACE MARK
        return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    }
    if (b0 == 0xE2) {
        if (b1 == 0x80) {
            // U+2000..U+200A, U+2028, U+2029, U+202F
            if ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF) return 3;
        } else if (b1 == 0x81 && b2 == 0x9F) {
            // U+205F MEDIUM MATHEMATICAL SPACE
            return 3;
        }
        return 0;
    }
    if (b0 == 0xE3) {
        // U+3000 IDEOGRAPHIC SPACE
        return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    }
    return 0;
}

std::vector<std::string> Analyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t ws = whitespaceLength(text, i);
        if (ws == 0) {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i]))));
            ++i;
            continue;
        }
        if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
        i += ws;
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::unordered_set<std::string> Analyzer::uniqueTokens(const std::string& text) {
    auto tokens = tokenize(text);
    return std::unordered_set<std::string>(tokens.begin(), tokens.end());
}

bool Analyzer::isBlank(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t ws = whitespaceLength(text, i);
        if (ws == 0) return false;
        i += ws;
    }
    return true;
}

} // namespace sentiment
