#pragma once

#include <cstddef>
#include <string>
#include "sentiment/Lexicon.hpp"

namespace sentiment {

enum class Label {
    Positive,
    Negative,
    Neutral
};

// "positive", "negative" or "neutral"
const char* labelName(Label label);

struct Prediction {
    Label label = Label::Neutral;
    double confidence = 0.50;
};

// Unique lexicon hits in a text.
struct MatchCounts {
    std::size_t positive = 0;
    std::size_t negative = 0;
};

// Keyword-count sentiment classifier. Owns its copy of the lexicon and never
// mutates it, so one instance can be shared by all request threads.
class Classifier {
public:
    static constexpr double kBaseConfidence = 0.50;
    static constexpr double kStepPerMatch = 0.10;
    static constexpr double kMaxConfidence = 0.99;

    explicit Classifier(Lexicon lexicon = Lexicon::defaults());

    MatchCounts count(const std::string& text) const;

    // Confidence is in [0.50, 0.99], rounded to 2 decimals.
    // A tie (including no matches) is neutral at 0.50.
    Prediction classify(const std::string& text) const;

private:
    Lexicon lexicon_;
};

} // namespace sentiment
