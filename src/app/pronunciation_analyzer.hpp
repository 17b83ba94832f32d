#pragma once

#include <string>
#include <vector>

#include "align/word_aligner.hpp"
#include "score/rubric.hpp"

namespace app {

/// Transcriber output: the full recognized text plus its time-stamped words
struct Transcript {
    std::string text;                            ///< Full transcribed text (may be empty)
    std::vector<align::TranscriptWord> words;    ///< Recognized words in time order
};

/// Result of one pronunciation analysis, owned by the caller
struct AnalysisResult {
    int overall_score = 0;                       ///< 0-100
    std::vector<align::WordResult> words;        ///< Target words in order, then insertions
    std::string transcribed_text;                ///< Transcript text as recognized
};

/// Tokenize the target sentence, align it against the transcript and score it.
///
/// The rubric is used as given; resolve it with score::resolve_rubric() first
/// when it comes from an untrusted source. An empty target sentence is valid and
/// yields score 0 with every transcript word reported as an insertion.
AnalysisResult analyze_pronunciation(const std::string& target_sentence,
                                     const Transcript& transcript,
                                     const score::RubricWeights& rubric);

} // namespace app
