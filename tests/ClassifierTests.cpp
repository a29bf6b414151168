#include "sentiment/Analyzer.hpp"
#include "sentiment/Classifier.hpp"
#include "sentiment/Lexicon.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using sentiment::Classifier;
using sentiment::Label;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

int main() {
    Classifier clf;

    // Tokenizer
    auto tokens = sentiment::Analyzer::tokenize("  Hello\tWORLD\n again ");
    expect(tokens.size() == 3, "tokenize should split on any whitespace");
    expect(tokens[0] == "hello" && tokens[1] == "world", "tokenize should lowercase");
    expect(sentiment::Analyzer::uniqueTokens("good Good GOOD").size() == 1, "unique tokens collapse duplicates");
    expect(sentiment::Analyzer::isBlank(" \t\r\n"), "whitespace-only is blank");
    expect(!sentiment::Analyzer::isBlank(" x "), "text with a word is not blank");

    // Separators beyond ASCII space
    const std::vector<std::string> separators = {
        "\x1c", "\x1d", "\x1e", "\x1f", "\x0b", "\x0c",
        "\xc2\x85", "\xc2\xa0", "\xe1\x9a\x80",
        "\xe2\x80\x80", "\xe2\x80\x8a", "\xe2\x80\xa8", "\xe2\x80\xa9",
        "\xe2\x80\xaf", "\xe2\x81\x9f", "\xe3\x80\x80"
    };
    for (const auto& sep : separators) {
        auto split = sentiment::Analyzer::tokenize("great" + sep + "amazing");
        expect(split.size() == 2 && split[0] == "great" && split[1] == "amazing",
               "separator should split words, bytes=" + std::to_string(sep.size()));
        expect(sentiment::Analyzer::isBlank(sep + " " + sep), "separator-only text is blank");
    }
    expect(sentiment::Analyzer::isBlank("\xe3\x80\x80\xc2\xa0"), "ideographic space + nbsp is blank");
    expect(sentiment::Analyzer::tokenize("caf\xc3\xa9 \xe2\x80\x8b").size() == 2, "zero-width space is not a separator");
    expect(!sentiment::Analyzer::isBlank("\xe2\x80\x8b"), "zero-width space is not blank");
    expect(sentiment::Analyzer::tokenize("na\xc3\xafve")[0] == "na\xc3\xafve", "multibyte letters pass through");

    // Lexicon
    const auto& lex = sentiment::Lexicon::defaults();
    expect(lex.positive.size() == 19 && lex.negative.size() == 19, "default lexicon sizes");
    for (const auto& w : lex.positive) {
        expect(lex.negative.count(w) == 0, "lexicon sets must be disjoint: " + w);
    }

    // Scenarios
    auto pos = clf.classify("This movie is great and amazing");
    expect(pos.label == Label::Positive, "great+amazing should be positive");
    expect(near(pos.confidence, 0.70), "two positive hits give 0.70");

    auto neg = clf.classify("This movie is terrible and awful");
    expect(neg.label == Label::Negative, "terrible+awful should be negative");
    expect(near(neg.confidence, 0.70), "two negative hits give 0.70");

    auto neu = clf.classify("The sky is blue today");
    expect(neu.label == Label::Neutral, "no hits should be neutral");
    expect(neu.confidence == 0.50, "neutral confidence is exactly 0.50");

    expect(clf.classify("This is excellent and wonderful").label == Label::Positive, "excellent+wonderful");
    expect(clf.classify("This is horrible and boring").label == Label::Negative, "horrible+boring");
    expect(clf.classify("The table is made of wood").label == Label::Neutral, "wood is neutral");

    // Case-insensitivity and duplicate collapse
    auto upper = clf.count("GREAT");
    auto lower = clf.count("great");
    expect(upper.positive == 1 && lower.positive == 1, "counts are case-insensitive");

    auto dup = clf.classify("good good good");
    expect(clf.count("good good good").positive == 1, "duplicates count once");
    expect(near(dup.confidence, 0.60), "single unique hit gives 0.60");
    expect(near(dup.confidence, clf.classify("good").confidence), "duplicates do not inflate confidence");

    // Ties are neutral regardless of evidence
    auto tie = clf.classify("good bad great awful");
    expect(tie.label == Label::Neutral && tie.confidence == 0.50, "tie should be neutral 0.50");

    // Majority wins by counts only
    auto mixed = clf.classify("good great bad");
    expect(mixed.label == Label::Positive && near(mixed.confidence, 0.70), "2 vs 1 positive at 0.70");

    // Saturation
    auto many = clf.classify("good great excellent amazing wonderful fantastic love");
    expect(many.label == Label::Positive, "many positive hits");
    expect(near(many.confidence, 0.99), "confidence caps at 0.99");
    auto five = clf.classify("bad terrible awful horrible worst");
    expect(near(five.confidence, 0.99), "five hits cap at 0.99");
    auto four = clf.classify("bad terrible awful horrible");
    expect(near(four.confidence, 0.90), "four hits give 0.90");

    // Punctuation stays attached
    expect(clf.classify("great!").label == Label::Neutral, "punctuated word does not match");

    // Label names
    expect(std::string(sentiment::labelName(Label::Positive)) == "positive", "positive name");
    expect(std::string(sentiment::labelName(Label::Negative)) == "negative", "negative name");
    expect(std::string(sentiment::labelName(Label::Neutral)) == "neutral", "neutral name");

    // Invariants over a spread of inputs
    const std::vector<std::string> inputs = {
        "", " ", "good", "BAD", "happy happy joy", "poor ugly boring useless broken fail",
        "love hate", "best worst best", "recommend outstanding superb brilliant perfect pleasant",
        "nothing here at all", "Awesome\tannoying\ndreadful"
    };
    for (const auto& text : inputs) {
        auto a = clf.classify(text);
        auto b = clf.classify(text);
        expect(a.label == b.label && a.confidence == b.confidence, "classify is deterministic: " + text);
        expect(a.confidence >= 0.50 && a.confidence <= 0.99, "confidence in range: " + text);
        expect((a.label == Label::Neutral) == (a.confidence == 0.50), "neutral iff 0.50: " + text);
        double cents = a.confidence * 100.0;
        expect(near(cents, std::round(cents)), "confidence has 2 decimals: " + text);
    }

    // Custom lexicon
    sentiment::Lexicon custom{{"sunny"}, {"rainy"}};
    Classifier weather(custom);
    expect(weather.classify("a sunny day").label == Label::Positive, "custom lexicon positive");
    expect(weather.classify("a great day").label == Label::Neutral, "custom lexicon ignores defaults");

    // The classifier keeps its own lexicon, so temporaries are fine
    Classifier fromTemporary(sentiment::Lexicon{{"sunny"}, {"rainy"}});
    auto sunny = fromTemporary.classify("a sunny day");
    expect(sunny.label == Label::Positive && near(sunny.confidence, 0.60), "classifier built from a temporary lexicon");
    expect(fromTemporary.classify("rainy again").label == Label::Negative, "temporary lexicon negative words");

    std::unique_ptr<Classifier> outlived;
    {
        sentiment::Lexicon scoped{{"warm"}, {"cold"}};
        outlived = std::make_unique<Classifier>(scoped);
    }
    expect(outlived->classify("warm tea").label == Label::Positive, "classifier outlives the lexicon it was built from");

    // Unicode separators between lexicon words
    auto nbsp = clf.classify("great\xc2\xa0" "amazing");
    expect(nbsp.label == Label::Positive && near(nbsp.confidence, 0.70), "nbsp separates words");
    auto unitSep = clf.classify("great\x1f" "amazing");
    expect(unitSep.label == Label::Positive && near(unitSep.confidence, 0.70), "unit separator separates words");
    auto ideographic = clf.classify("terrible\xe3\x80\x80" "awful");
    expect(ideographic.label == Label::Negative, "ideographic space separates words");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
