#pragma once
#include <string>
#include <vector>

namespace app {

// Built-in sentences used when a learner has no assigned exercise
const std::vector<std::string>& default_practice_sentences();

// "R-sound practice", "S-sound practice", "Fluency reading"
std::vector<std::string> exercise_categories();

// Sentences for one category; empty if the category is unknown
std::vector<std::string> exercise_sentences(const std::string& category);
}
