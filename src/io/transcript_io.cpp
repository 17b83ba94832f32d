#include "io/transcript_io.hpp"
#include "core/logging.hpp"
#include "text/tokenizer.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace io {

namespace {

// Whisper emits bracketed markers for silence and noise
bool is_non_speech(const std::string& w) {
    return w.size() > 2 && w.front() == '[' && w.back() == ']';
}

// Split one CSV row. Quoted fields accept both \" (whisper) and "" (RFC 4180).
bool split_csv_row(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '\\' && i + 1 < line.size()) {
                cur.push_back(line[++i]);
            } else if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
                else quoted = false;
            } else {
                cur.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (quoted) return false;
    fields.push_back(cur);
    return true;
}

bool parse_number(const std::string& s, double& out) {
    const std::string t = text::trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    out = std::strtod(t.c_str(), &end);
    return end != t.c_str() && *end == '\0';
}

void add_word(app::Transcript& out, const std::string& raw, double t0_s, double t1_s) {
    std::string w = text::trim(raw);
    if (w.empty() || is_non_speech(w)) return;
    out.words.push_back({ w, static_cast<float>(t0_s), static_cast<float>(t1_s) });
}

void fill_text(app::Transcript& out) {
    std::vector<std::string> words;
    words.reserve(out.words.size());
    for (const auto& w : out.words) words.push_back(w.text);
    out.text = text::join_words(words);
}

} // namespace

bool read_transcript_csv(std::istream& in, app::Transcript& out, std::string& error) {
    app::Transcript t;
    std::string line;
    std::vector<std::string> fields;

    if (!std::getline(in, line)) {
        error = "empty CSV transcript";
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!split_csv_row(line, fields) || fields.size() < 3 || text::trim(fields[0]) != "start" || text::trim(fields[1]) != "end" ||
        text::trim(fields.back()) != "text") {
        error = "CSV header must be start,end[,speaker],text";
        return false;
    }
    const size_t n_cols = fields.size();

    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (text::trim(line).empty()) continue;
        if (!split_csv_row(line, fields) || fields.size() != n_cols) {
            error = "line " + std::to_string(line_no) + ": malformed CSV row";
            return false;
        }
        double t0_ms = 0.0, t1_ms = 0.0;
        if (!parse_number(fields[0], t0_ms) || !parse_number(fields[1], t1_ms)) {
            error = "line " + std::to_string(line_no) + ": bad timestamp";
            return false;
        }
        add_word(t, fields.back(), t0_ms / 1000.0, t1_ms / 1000.0);
    }
    fill_text(t);
    out = std::move(t);
    return true;
}

bool read_transcript_words(std::istream& in, app::Transcript& out, std::string& error) {
    app::Transcript t;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const std::string row = text::trim(line);
        if (row.empty() || row[0] == '#') continue;

        std::istringstream ss(row);
        std::string t0, t1;
        double t0_s = 0.0, t1_s = 0.0;
        if (!(ss >> t0 >> t1) || !parse_number(t0, t0_s) || !parse_number(t1, t1_s)) {
            error = "line " + std::to_string(line_no) + ": expected \"start end word\"";
            return false;
        }
        std::string word, extra;
        if (!(ss >> word)) {
            error = "line " + std::to_string(line_no) + ": missing word";
            return false;
        }
        if (ss >> extra) {
            error = "line " + std::to_string(line_no) + ": more than one word after the timestamps";
            return false;
        }
        add_word(t, word, t0_s, t1_s);
    }
    fill_text(t);
    out = std::move(t);
    return true;
}

bool load_transcript(const std::string& path, app::Transcript& out, std::string& error) {
    std::ifstream f(path);
    if (!f) {
        error = "cannot open transcript: " + path;
        return false;
    }
    const bool is_csv = path.size() >= 4 && text::to_lower(path.substr(path.size() - 4)) == ".csv";
    const bool ok = is_csv ? read_transcript_csv(f, out, error) : read_transcript_words(f, out, error);
    if (!ok) {
        error = path + ": " + error;
        return false;
    }
    core::log_debug("loaded " + std::to_string(out.words.size()) + " words from " + path);
    return true;
}
}
