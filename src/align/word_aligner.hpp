#pragma once
#include <optional>
#include <string>
#include <vector>

namespace align {

// A word recognized by the transcriber, with timing in seconds
struct TranscriptWord {
    std::string text;
    float start_s{};
    float end_s{};
};

enum class WordError {
    None,              // target word matched exactly
    Mispronunciation,  // target word matched a close transcript word
    Omission,          // target word not found in the transcript
    Insertion          // transcript word matched to no target word
};

// "none", "mispronunciation", "omission", "insertion"
const char* to_string(WordError e);

struct WordResult {
    std::string word;                          // target text, or transcript text for insertions
    WordError error = WordError::None;
    std::optional<std::string> transcribed_as; // set for Mispronunciation only
};

// Greedy two-phase matching of target words against transcript words.
//
// For each target word in sentence order, the first unconsumed transcript word
// equal to it (case-insensitive) is taken as a correct match. Failing that, the
// unconsumed transcript word with the smallest edit distance d where
// 0 < d <= threshold is taken as a mispronunciation; ties go to the earliest
// transcript position. Otherwise the target word is an omission. Transcript
// words never consumed are appended as insertions, in transcript order.
//
// One result per target word comes first, in target order, followed by the
// insertions.
std::vector<WordResult> align_words(const std::vector<std::string>& target_words,
                                    const std::vector<TranscriptWord>& transcript,
                                    int threshold);
}
