#pragma once
#include <cstddef>
#include <string>

namespace text {

// Levenshtein distance with unit cost for substitution, insertion and deletion,
// counted in code points. Callers fold case first when case should not count.
size_t levenshtein_distance(const std::u32string& a, const std::u32string& b);

// UTF-8 convenience overload; decodes both sides
size_t levenshtein_distance(const std::string& a, const std::string& b);
}
