#include "app/pronunciation_analyzer.hpp"

#include "core/logging.hpp"
#include "score/rubric_scorer.hpp"
#include "text/tokenizer.hpp"

namespace app {

static std::string transcript_text(const Transcript& t) {
    if (!t.text.empty()) return text::trim(t.text);
    std::vector<std::string> words;
    words.reserve(t.words.size());
    for (const auto& w : t.words) words.push_back(w.text);
    return text::join_words(words);
}

AnalysisResult analyze_pronunciation(const std::string& target_sentence,
                                     const Transcript& transcript,
                                     const score::RubricWeights& rubric) {
    const auto target_words = text::tokenize_target(target_sentence);
    if (target_words.empty()) {
        core::log_warn("target sentence has no words; every transcript word counts as an insertion");
    }

    AnalysisResult result;
    result.transcribed_text = transcript_text(transcript);
    result.words = align::align_words(target_words, transcript.words, rubric.mispronunciation_threshold);
    result.overall_score = score::score_words(result.words, rubric);

    core::log_debug("analysis: " + std::to_string(target_words.size()) + " target words, " +
                    std::to_string(transcript.words.size()) + " transcript words, score " +
                    std::to_string(result.overall_score));
    return result;
}

} // namespace app
