#include "score/rubric.hpp"
#include "core/logging.hpp"
#include "text/tokenizer.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace score {

RubricWeights default_rubric() { return RubricWeights{}; }

RubricWeights apply_override(const RubricWeights& base, const RubricOverride& over) {
    RubricWeights w = base;
    if (over.mispronunciation_weight) w.mispronunciation_weight = *over.mispronunciation_weight;
    if (over.omission_weight) w.omission_weight = *over.omission_weight;
    if (over.insertion_weight) w.insertion_weight = *over.insertion_weight;
    if (over.mispronunciation_threshold) w.mispronunciation_threshold = *over.mispronunciation_threshold;
    return w;
}

static int clamp_field(const char* name, int value, int lo, int hi) {
    int v = std::clamp(value, lo, hi);
    if (v != value) {
        core::log_warn(std::string("rubric ") + name + "=" + std::to_string(value) +
                       " out of range, using " + std::to_string(v));
    }
    return v;
}

RubricWeights sanitize_rubric(const RubricWeights& w) {
    RubricWeights out;
    out.mispronunciation_weight = clamp_field("mispronunciation_weight", w.mispronunciation_weight, MIN_WEIGHT, MAX_WEIGHT);
    out.omission_weight = clamp_field("omission_weight", w.omission_weight, MIN_WEIGHT, MAX_WEIGHT);
    out.insertion_weight = clamp_field("insertion_weight", w.insertion_weight, MIN_WEIGHT, MAX_WEIGHT);
    out.mispronunciation_threshold = clamp_field("mispronunciation_threshold", w.mispronunciation_threshold, 0, INT_MAX);
    return out;
}

RubricWeights resolve_rubric(const std::optional<RubricOverride>& over) {
    if (!over) return default_rubric();
    return sanitize_rubric(apply_override(default_rubric(), *over));
}

static bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

static std::optional<int>* field_for_key(RubricOverride& o, const std::string& key) {
    if (key == "mispronunciation_weight" || key == "mispronunciationWeight") return &o.mispronunciation_weight;
    if (key == "omission_weight" || key == "omissionWeight") return &o.omission_weight;
    if (key == "insertion_weight" || key == "insertionWeight") return &o.insertion_weight;
    if (key == "mispronunciation_threshold" || key == "mispronunciationThreshold") return &o.mispronunciation_threshold;
    return nullptr;
}

bool parse_rubric(const std::string& content, RubricOverride& out, std::string& error) {
    RubricOverride parsed;
    std::istringstream in(content);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = text::trim(line);
        if (line.empty()) continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            error = "line " + std::to_string(line_no) + ": expected key = value";
            return false;
        }
        const std::string key = text::trim(line.substr(0, eq));
        const std::string value = text::trim(line.substr(eq + 1));
        std::optional<int>* field = field_for_key(parsed, key);
        if (!field) {
            error = "line " + std::to_string(line_no) + ": unknown key '" + key + "'";
            return false;
        }
        int v = 0;
        if (!parse_int(value, v)) {
            error = "line " + std::to_string(line_no) + ": '" + value + "' is not an integer";
            return false;
        }
        *field = v;
    }
    out = parsed;
    return true;
}

bool load_rubric_file(const std::string& path, RubricOverride& out, std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "cannot open rubric file: " + path;
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    if (!parse_rubric(ss.str(), out, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

std::string describe_rubric(const RubricWeights& w) {
    return "mispronunciation=" + std::to_string(w.mispronunciation_weight) +
           " omission=" + std::to_string(w.omission_weight) +
           " insertion=" + std::to_string(w.insertion_weight) +
           " threshold=" + std::to_string(w.mispronunciation_threshold);
}
}
