#include "io/report.hpp"
#include "score/rubric_scorer.hpp"
#include <cstdio>
#include <iomanip>

namespace io {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (unsigned char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out += buf;
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
    }
    return out;
}

void write_analysis_json(std::ostream& os, const app::AnalysisResult& result,
                         const score::RubricWeights& rubric) {
    int indent = 0;
    auto doindent = [&]() { for (int i = 0; i < indent; ++i) os << "  "; };
    auto start_obj = [&](const char* name) {
        doindent();
        if (name) os << "\"" << name << "\": {\n";
        else os << "{\n";
        ++indent;
    };
    auto end_obj = [&](bool end) {
        --indent;
        doindent();
        os << (end ? "}\n" : "},\n");
    };
    auto value_s = [&](const char* name, const std::string& val, bool end) {
        doindent();
        os << "\"" << name << "\": \"" << json_escape(val) << (end ? "\"\n" : "\",\n");
    };
    auto value_i = [&](const char* name, long long val, bool end) {
        doindent();
        os << "\"" << name << "\": " << val << (end ? "\n" : ",\n");
    };

    const auto summary = score::summarize_words(result.words);

    start_obj(nullptr);
        value_i("overall_score", result.overall_score, false);
        value_s("transcribed_text", result.transcribed_text, false);
        start_obj("rubric");
            value_i("mispronunciation_weight", rubric.mispronunciation_weight, false);
            value_i("omission_weight", rubric.omission_weight, false);
            value_i("insertion_weight", rubric.insertion_weight, false);
            value_i("mispronunciation_threshold", rubric.mispronunciation_threshold, true);
        end_obj(false);
        start_obj("summary");
            value_i("correct", static_cast<long long>(summary.correct), false);
            value_i("mispronounced", static_cast<long long>(summary.mispronounced), false);
            value_i("omitted", static_cast<long long>(summary.omitted), false);
            value_i("inserted", static_cast<long long>(summary.inserted), true);
        end_obj(false);
        doindent();
        os << "\"words\": [";
        if (result.words.empty()) {
            os << "]\n";
        } else {
            os << "\n";
            ++indent;
            for (size_t i = 0; i < result.words.size(); ++i) {
                const auto& w = result.words[i];
                const bool last = (i + 1 == result.words.size());
                doindent();
                os << "{ \"word\": \"" << json_escape(w.word) << "\", \"error\": \""
                   << align::to_string(w.error) << "\"";
                if (w.transcribed_as) {
                    os << ", \"transcribed_as\": \"" << json_escape(*w.transcribed_as) << "\"";
                }
                os << (last ? " }\n" : " },\n");
            }
            --indent;
            doindent();
            os << "]\n";
        }
    end_obj(true);
}

void write_analysis_text(std::ostream& os, const app::AnalysisResult& result,
                         const score::RubricWeights& rubric) {
    const auto summary = score::summarize_words(result.words);

    os << "Score: " << result.overall_score << "/100\n";
    os << "Transcribed: " << result.transcribed_text << "\n";
    os << "Rubric: " << score::describe_rubric(rubric) << "\n";
    os << "Words: " << summary.correct << " correct, " << summary.mispronounced << " mispronounced, "
       << summary.omitted << " omitted, " << summary.inserted << " inserted\n\n";

    for (const auto& w : result.words) {
        os << "  " << std::left << std::setw(18) << w.word << " " << align::to_string(w.error);
        if (w.transcribed_as) os << " (heard \"" << *w.transcribed_as << "\")";
        os << "\n";
    }
    os << std::right;
}
}
