#include "align/word_aligner.hpp"
#include "core/logging.hpp"
#include "text/edit_distance.hpp"
#include "text/utf8.hpp"
#include <limits>

namespace align {

const char* to_string(WordError e) {
    switch (e) {
    case WordError::None: return "none";
    case WordError::Mispronunciation: return "mispronunciation";
    case WordError::Omission: return "omission";
    case WordError::Insertion: return "insertion";
    }
    return "unknown";
}

std::vector<WordResult> align_words(const std::vector<std::string>& target_words,
                                    const std::vector<TranscriptWord>& transcript,
                                    int threshold) {
    std::vector<WordResult> results;
    results.reserve(target_words.size() + transcript.size());

    // Fold once; matching is case-insensitive over code points but results keep
    // the transcript text
    std::vector<std::u32string> lowered;
    lowered.reserve(transcript.size());
    for (const auto& tw : transcript) lowered.push_back(text::folded(tw.text));

    std::vector<bool> consumed(transcript.size(), false);

    for (const auto& target : target_words) {
        const std::u32string lower_target = text::folded(target);

        bool matched = false;
        for (size_t i = 0; i < transcript.size(); ++i) {
            if (!consumed[i] && lowered[i] == lower_target) {
                consumed[i] = true;
                results.push_back({ target, WordError::None, std::nullopt });
                core::log_debug("match: \"" + target + "\" -> \"" + transcript[i].text + "\" (exact)");
                matched = true;
                break;
            }
        }
        if (matched) continue;

        size_t best = transcript.size();
        size_t min_distance = std::numeric_limits<size_t>::max();
        for (size_t i = 0; i < transcript.size(); ++i) {
            if (consumed[i]) continue;
            const size_t d = text::levenshtein_distance(lower_target, lowered[i]);
            // strictly-less keeps the first candidate among equal distances
            if (d > 0 && threshold >= 0 && d <= static_cast<size_t>(threshold) && d < min_distance) {
                min_distance = d;
                best = i;
            }
        }

        if (best < transcript.size()) {
            consumed[best] = true;
            results.push_back({ target, WordError::Mispronunciation, transcript[best].text });
            core::log_debug("match: \"" + target + "\" -> \"" + transcript[best].text +
                            "\" (mispronunciation, distance " + std::to_string(min_distance) + ")");
        } else {
            results.push_back({ target, WordError::Omission, std::nullopt });
            core::log_debug("omission: \"" + target + "\"");
        }
    }

    for (size_t i = 0; i < transcript.size(); ++i) {
        if (consumed[i]) continue;
        results.push_back({ transcript[i].text, WordError::Insertion, std::nullopt });
        core::log_debug("insertion: \"" + transcript[i].text + "\"");
    }
    return results;
}
}
