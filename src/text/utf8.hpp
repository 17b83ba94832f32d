#pragma once
#include <string>

namespace text {

// Decode UTF-8 into code points. Malformed or truncated sequences decode to
// U+FFFD, one per offending byte.
std::u32string utf8_decode(const std::string& s);

// Encode code points as UTF-8
std::string utf8_encode(const std::u32string& s);

// Simple lowercase mapping for ASCII, Latin-1 Supplement, Latin Extended-A,
// basic Greek and Cyrillic capitals. Other code points are returned unchanged.
char32_t fold_case(char32_t c);

// Decode and fold case in one pass; the form words are compared in
std::u32string folded(const std::string& s);
}
