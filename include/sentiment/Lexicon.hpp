#pragma once

#include <string>
#include <unordered_set>

namespace sentiment {

// Keyword sets used for scoring. Words are lowercase; the two sets are disjoint.
struct Lexicon {
    std::unordered_set<std::string> positive;
    std::unordered_set<std::string> negative;

    // Built-in word lists, constructed once on first use.
    static const Lexicon& defaults();
};

} // namespace sentiment
