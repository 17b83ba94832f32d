#include <cassert>
#include <string>
#include <vector>
#include "align/word_aligner.hpp"
#include "score/rubric_scorer.hpp"

using align::WordError;
using align::WordResult;

static WordResult w(const std::string& word, WordError e) {
    return WordResult{ word, e, std::nullopt };
}

static void test_reference_scores() {
    const score::RubricWeights defaults;

    // all correct
    assert(score::score_words({ w("the", WordError::None), w("cat", WordError::None), w("sat", WordError::None) },
                              defaults) == 100);
    // one mispronunciation at weight 50: (100+50+100)/300 -> 83
    assert(score::score_words({ w("the", WordError::None), w("cat", WordError::Mispronunciation),
                                w("sat", WordError::None) }, defaults) == 83);
    // one omission at weight 70: (100+30+100)/300 -> 77
    assert(score::score_words({ w("the", WordError::None), w("cat", WordError::Omission),
                                w("sat", WordError::None) }, defaults) == 77);
    // one insertion at weight 30: (100+100-30)/200 -> 85
    assert(score::score_words({ w("the", WordError::None), w("cat", WordError::None),
                                w("now", WordError::Insertion) }, defaults) == 85);
    // all omitted: 90/300 -> 30
    assert(score::score_words({ w("the", WordError::Omission), w("cat", WordError::Omission),
                                w("sat", WordError::Omission) }, defaults) == 30);
}

static void test_degenerate() {
    const score::RubricWeights defaults;
    assert(score::score_words({}, defaults) == 0);
    // insertions alone have no possible points
    assert(score::score_words({ w("um", WordError::Insertion), w("uh", WordError::Insertion) }, defaults) == 0);
}

static void test_clamped_at_zero() {
    score::RubricWeights r;
    r.insertion_weight = 100;
    std::vector<WordResult> words = { w("the", WordError::None) };
    for (int i = 0; i < 5; ++i) words.push_back(w("noise", WordError::Insertion));
    assert(score::score_words(words, r) == 0);
}

static void test_weight_extremes() {
    score::RubricWeights r;
    r.mispronunciation_weight = 100;
    r.omission_weight = 0;
    // weight 100 mispronunciation is worth nothing; weight 0 omission counts as correct
    assert(score::score_words({ w("cat", WordError::Mispronunciation) }, r) == 0);
    assert(score::score_words({ w("cat", WordError::Omission) }, r) == 100);
}

static void test_rounding() {
    // (300 + 50) / 400 = 87.5 -> 88
    score::RubricWeights r;
    assert(score::score_words({ w("a", WordError::None), w("b", WordError::None), w("c", WordError::None),
                                w("d", WordError::Mispronunciation) }, r) == 88);
}

static void test_monotonicity() {
    const std::vector<WordResult> words = {
        w("the", WordError::None), w("cat", WordError::Mispronunciation),
        w("sat", WordError::Omission), w("um", WordError::Insertion)
    };
    score::RubricWeights r;
    int prev = 101;
    for (int mw = 0; mw <= 100; mw += 5) {
        r.mispronunciation_weight = mw;
        int s = score::score_words(words, r);
        assert(s >= 0 && s <= 100);
        assert(s <= prev);
        prev = s;
    }
    r = score::RubricWeights{};
    prev = 101;
    for (int iw = 0; iw <= 100; iw += 5) {
        r.insertion_weight = iw;
        int s = score::score_words(words, r);
        assert(s <= prev);
        prev = s;
    }
}

static void test_summary() {
    auto s = score::summarize_words({ w("the", WordError::None), w("cat", WordError::Mispronunciation),
                                      w("sat", WordError::Omission), w("um", WordError::Insertion),
                                      w("uh", WordError::Insertion) });
    assert(s.correct == 1);
    assert(s.mispronounced == 1);
    assert(s.omitted == 1);
    assert(s.inserted == 2);
    assert(s.target_words() == 3);
}

int main() {
    test_reference_scores();
    test_degenerate();
    test_clamped_at_zero();
    test_weight_extremes();
    test_rounding();
    test_monotonicity();
    test_summary();
    return 0;
}
