#include "score/rubric_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace score {

int score_words(const std::vector<align::WordResult>& results, const RubricWeights& weights) {
    double total_possible = 0.0;
    double actual = 0.0;

    for (const auto& r : results) {
        if (r.error != align::WordError::Insertion) total_possible += 100.0;

        switch (r.error) {
        case align::WordError::None:
            actual += 100.0;
            break;
        case align::WordError::Mispronunciation:
            actual += 100.0 * (100 - weights.mispronunciation_weight) / 100.0;
            break;
        case align::WordError::Omission:
            actual += 100.0 * (100 - weights.omission_weight) / 100.0;
            break;
        case align::WordError::Insertion:
            actual -= weights.insertion_weight;
            break;
        }
    }

    if (total_possible <= 0.0) return 0;
    double final_score = actual / total_possible * 100.0;
    final_score = std::clamp(final_score, 0.0, 100.0);
    return static_cast<int>(std::lround(final_score));
}

WordSummary summarize_words(const std::vector<align::WordResult>& results) {
    WordSummary s;
    for (const auto& r : results) {
        switch (r.error) {
        case align::WordError::None: ++s.correct; break;
        case align::WordError::Mispronunciation: ++s.mispronounced; break;
        case align::WordError::Omission: ++s.omitted; break;
        case align::WordError::Insertion: ++s.inserted; break;
        }
    }
    return s;
}
}
