#pragma once
#include <cstddef>
#include <vector>
#include "align/word_aligner.hpp"
#include "score/rubric.hpp"

namespace score {

struct WordSummary {
    size_t correct = 0;
    size_t mispronounced = 0;
    size_t omitted = 0;
    size_t inserted = 0;

    size_t target_words() const { return correct + mispronounced + omitted; }
};

// Overall 0-100 score. Each target word is worth 100 possible points and earns
// 100 when correct, 100 - weight when mispronounced or omitted. Each insertion
// deducts insertion_weight from the earned points without adding a slot.
// Returns 0 when there are no target words.
int score_words(const std::vector<align::WordResult>& results, const RubricWeights& weights);

WordSummary summarize_words(const std::vector<align::WordResult>& results);
}
