#include "sentiment/Classifier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include "sentiment/Analyzer.hpp"

namespace sentiment {

namespace {

double confidenceFor(std::size_t matches) {
    double raw = std::min(Classifier::kBaseConfidence + Classifier::kStepPerMatch * static_cast<double>(matches),
                          Classifier::kMaxConfidence);
    return std::round(raw * 100.0) / 100.0;
}

} // namespace

const char* labelName(Label label) {
    switch (label) {
        case Label::Positive: return "positive";
        case Label::Negative: return "negative";
        case Label::Neutral: break;
    }
    return "neutral";
}

Classifier::Classifier(Lexicon lexicon) : lexicon_(std::move(lexicon)) {}

MatchCounts Classifier::count(const std::string& text) const {
    MatchCounts counts;
    for (const auto& token : Analyzer::uniqueTokens(text)) {
        if (lexicon_.positive.count(token)) {
            ++counts.positive;
        }
        if (lexicon_.negative.count(token)) {
            ++counts.negative;
        }
    }
    return counts;
}

Prediction Classifier::classify(const std::string& text) const {
    auto counts = count(text);

    Prediction p;
    if (counts.positive > counts.negative) {
        p.label = Label::Positive;
        p.confidence = confidenceFor(counts.positive);
    } else if (counts.negative > counts.positive) {
        p.label = Label::Negative;
        p.confidence = confidenceFor(counts.negative);
    } else {
        p.label = Label::Neutral;
        p.confidence = kBaseConfidence;
    }
    return p;
}

} // namespace sentiment
