#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace sentiment {

// Simple text analyzer; split on whitespace and lowercase.
// Whitespace covers the Unicode space separators and line breaks,
// matched on UTF-8 bytes: ASCII \t..\r, 0x1C..0x1F, space, U+0085, U+00A0,
// U+1680, U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000.
// Only ASCII letters are lowercased. Punctuation stays attached to its word.
class Analyzer {
public:
    static std::vector<std::string> tokenize(const std::string& text);

    // Same tokens with duplicates collapsed.
    static std::unordered_set<std::string> uniqueTokens(const std::string& text);

    // True if text has nothing but whitespace.
    static bool isBlank(const std::string& text);

    // Byte length of the whitespace character starting at pos, or 0.
    static std::size_t whitespaceLength(const std::string& text, std::size_t pos);
};

} // namespace sentiment
