#include "text/edit_distance.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <vector>

namespace text {

size_t levenshtein_distance(const std::u32string& a, const std::u32string& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    // Two rolling rows over b; prev[j] = distance(a[0:i-1], b[0:j])
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                cur[j] = prev[j - 1];
            } else {
                cur[j] = 1 + std::min({ prev[j - 1],   // substitution
                                        cur[j - 1],    // insertion
                                        prev[j] });    // deletion
            }
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

size_t levenshtein_distance(const std::string& a, const std::string& b) {
    return levenshtein_distance(utf8_decode(a), utf8_decode(b));
}
}
