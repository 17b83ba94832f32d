#pragma once
#include <string>
#include <vector>

namespace text {

// Lowercase copy of UTF-8 text, using the case mapping of text::fold_case
std::string to_lower(const std::string& s);

// Split a target sentence into lowercase word tokens on any ASCII whitespace.
// Punctuation stays attached to its word ("dog." is one token).
std::vector<std::string> tokenize_target(const std::string& sentence);

// Space-joined words, for transcripts that arrive without their full text
std::string join_words(const std::vector<std::string>& words);

// Strip leading/trailing whitespace
std::string trim(const std::string& s);
}
