// Score one pronunciation attempt from a transcript file
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include "app/practice_sentences.hpp"
#include "app/pronunciation_analyzer.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "io/report.hpp"
#include "io/transcript_io.hpp"
#include "score/rubric.hpp"

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --transcript <file> (--target \"<sentence>\" | --sentence N)\n"
              << "           [--rubric <file>] [--json] [-v]\n"
              << "       " << argv0 << " --list-sentences\n\n"
              << "  --transcript FILE  whisper-cli word CSV (-ml 1 -sow -ocsv) or \"start end word\" lines\n"
              << "  --target TEXT      sentence the speaker was asked to read\n"
              << "  --sentence N       use built-in practice sentence N (see --list-sentences)\n"
              << "  --rubric FILE      key = value rubric overrides (default: $PRONOUNCE_RUBRIC)\n"
              << "  --json             print the result as JSON\n"
              << "  -v, --verbose      log every alignment decision\n";
}

static void list_sentences() {
    const auto& defaults = app::default_practice_sentences();
    std::cout << "Practice sentences:\n";
    for (size_t i = 0; i < defaults.size(); ++i) {
        std::cout << "  " << i << ": " << defaults[i] << "\n";
    }
    for (const auto& category : app::exercise_categories()) {
        std::cout << "\n" << category << ":\n";
        for (const auto& s : app::exercise_sentences(category)) std::cout << "  - " << s << "\n";
    }
}

// Non-negative decimal index; rejects empty input, trailing characters and overflow
static bool parse_index(const char* s, int& out) {
    if (!s || !*s) return false;
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0' || v < 0 || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

int main(int argc, char** argv) {
    std::string transcript_path;
    std::string target;
    std::string rubric_path = core::get_config().rubric_path;
    int sentence_index = -1;
    bool json = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { core::set_verbose(true); continue; }
        if (a == "--json") { json = true; continue; }
        if (a == "--list-sentences") { list_sentences(); return 0; }
        if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
        if (a == "--transcript" && i + 1 < argc) { transcript_path = argv[++i]; continue; }
        if (a == "--target" && i + 1 < argc) { target = argv[++i]; continue; }
        if (a == "--sentence" && i + 1 < argc) {
            const char* value = argv[++i];
            if (!parse_index(value, sentence_index)) {
                core::log_error(std::string("invalid sentence index: ") + value);
                return 1;
            }
            continue;
        }
        if (a == "--rubric" && i + 1 < argc) { rubric_path = argv[++i]; continue; }
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (sentence_index >= 0) {
        const auto& defaults = app::default_practice_sentences();
        if (static_cast<size_t>(sentence_index) >= defaults.size()) {
            core::log_error("sentence index out of range: " + std::to_string(sentence_index));
            return 1;
        }
        target = defaults[static_cast<size_t>(sentence_index)];
    }
    if (transcript_path.empty() || target.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    std::optional<score::RubricOverride> rubric_override;
    if (!rubric_path.empty()) {
        score::RubricOverride over;
        std::string error;
        if (!score::load_rubric_file(rubric_path, over, error)) {
            core::log_error(error);
            return 1;
        }
        if (over.empty()) core::log_warn("rubric file sets no fields, using defaults: " + rubric_path);
        rubric_override = over;
    }
    const score::RubricWeights rubric = score::resolve_rubric(rubric_override);
    core::log_debug("rubric: " + score::describe_rubric(rubric));

    app::Transcript transcript;
    std::string error;
    if (!io::load_transcript(transcript_path, transcript, error)) {
        core::log_error(error);
        return 1;
    }

    const app::AnalysisResult result = app::analyze_pronunciation(target, transcript, rubric);
    if (json) {
        io::write_analysis_json(std::cout, result, rubric);
    } else {
        std::cout << "Target: " << target << "\n";
        io::write_analysis_text(std::cout, result, rubric);
    }
    return 0;
}
