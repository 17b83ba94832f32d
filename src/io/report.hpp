#pragma once
#include <ostream>
#include <string>
#include "app/pronunciation_analyzer.hpp"
#include "score/rubric.hpp"

namespace io {

// JSON document: overall_score, transcribed_text, rubric, summary counts and
// one entry per word ({word, error, transcribed_as?}).
void write_analysis_json(std::ostream& os, const app::AnalysisResult& result,
                         const score::RubricWeights& rubric);

// Human-readable report, one line per word
void write_analysis_text(std::ostream& os, const app::AnalysisResult& result,
                         const score::RubricWeights& rubric);

// Escape for a JSON string literal (quotes, backslashes, control characters)
std::string json_escape(const std::string& s);
}
