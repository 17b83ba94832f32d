#include "text/tokenizer.hpp"
#include "text/utf8.hpp"
#include <cctype>

namespace text {

std::string to_lower(const std::string& s) {
    return utf8_encode(folded(s));
}

std::vector<std::string> tokenize_target(const std::string& sentence) {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char uc : sentence) {
        if (std::isspace(uc)) {
            if (!cur.empty()) { out.push_back(to_lower(cur)); cur.clear(); }
        } else {
            cur.push_back(static_cast<char>(uc));
        }
    }
    if (!cur.empty()) out.push_back(to_lower(cur));
    return out;
}

std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (w.empty()) continue;
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return std::string();
    return s.substr(a, b - a + 1);
}
}
