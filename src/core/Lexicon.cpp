#include "sentiment/Lexicon.hpp"

namespace sentiment {

const Lexicon& Lexicon::defaults() {
    static const Lexicon lexicon{
        {
            "good", "great", "excellent", "amazing", "wonderful",
            "fantastic", "love", "best", "happy", "awesome",
            "brilliant", "superb", "enjoy", "liked", "perfect",
            "recommend", "outstanding", "positive", "pleasant",
        },
        {
            "bad", "terrible", "awful", "horrible", "worst",
            "hate", "poor", "disappointing", "boring", "ugly",
            "negative", "annoying", "dislike", "mediocre", "fail",
            "broken", "useless", "frustrating", "dreadful",
        }
    };
    return lexicon;
}

} // namespace sentiment
