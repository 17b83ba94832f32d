#pragma once
#include <optional>
#include <string>

namespace score {

constexpr int MIN_WEIGHT = 0;
constexpr int MAX_WEIGHT = 100;

/// Penalty weights applied by the scorer. A higher weight costs more points.
struct RubricWeights {
    int mispronunciation_weight = 50;   ///< [0,100]; 100 scores a mispronunciation like a miss
    int omission_weight = 70;           ///< [0,100]
    int insertion_weight = 30;          ///< [0,100]; flat deduction per inserted word
    int mispronunciation_threshold = 3; ///< >= 0; max edit distance still counted as mispronounced
};

/// Partial rubric as a store or file supplies it; unset fields keep the base value.
struct RubricOverride {
    std::optional<int> mispronunciation_weight;
    std::optional<int> omission_weight;
    std::optional<int> insertion_weight;
    std::optional<int> mispronunciation_threshold;

    bool empty() const {
        return !mispronunciation_weight && !omission_weight && !insertion_weight &&
               !mispronunciation_threshold;
    }
};

RubricWeights default_rubric();

// Field-wise merge: every field set in `over` replaces the one in `base`.
RubricWeights apply_override(const RubricWeights& base, const RubricOverride& over);

// Clamp weights into [0,100] and the threshold to >= 0, warning for each
// field that had to be adjusted.
RubricWeights sanitize_rubric(const RubricWeights& w);

// Defaults when no override is available, otherwise defaults merged with the
// override. The result is always sanitized.
RubricWeights resolve_rubric(const std::optional<RubricOverride>& over);

// Parse "key = value" lines ('#' starts a comment). Keys are
// mispronunciation_weight, omission_weight, insertion_weight and
// mispronunciation_threshold (camelCase spellings are accepted too).
// Returns false with a message on unknown keys or non-integer values.
bool parse_rubric(const std::string& content, RubricOverride& out, std::string& error);

bool load_rubric_file(const std::string& path, RubricOverride& out, std::string& error);

// "mispronunciation=50 omission=70 insertion=30 threshold=3"
std::string describe_rubric(const RubricWeights& w);
}
