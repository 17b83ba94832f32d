#include "app/practice_sentences.hpp"
#include <map>

namespace app {

namespace {
const std::map<std::string, std::vector<std::string>>& exercise_table() {
    static const std::map<std::string, std::vector<std::string>> table = {
        { "R-sound practice", {
            "Rahul runs really fast.",
            "The red car raced around the track.",
            "A roaring fire warmed the room.",
            "The brave knight rescued the princess.",
            "Remember to read your book.",
        } },
        { "S-sound practice", {
            "She sells shiny shoes.",
            "The sun shines brightly in the sky.",
            "Sally sings sweet songs.",
            "Seven sleepy sheep slept soundly.",
            "The snake slithered silently through the grass.",
        } },
        { "Fluency reading", {
            "In the quiet forest, a tiny squirrel gathered nuts for the winter.",
            "The old wizard cast a powerful spell, and the ancient castle began to glow.",
            "Children laughed and played in the park, enjoying the warm afternoon sunshine.",
            "The vast ocean stretched endlessly, its waves crashing gently against the sandy shore.",
            "Learning new things can be challenging, but it is always rewarding in the end.",
        } },
    };
    return table;
}
} // namespace

const std::vector<std::string>& default_practice_sentences() {
    static const std::vector<std::string> sentences = {
        "The quick brown fox jumps over the lazy dog.",
        "She sells seashells by the seashore.",
        "Peter Piper picked a peck of pickled peppers.",
        "How much wood would a woodchuck chuck if a woodchuck could chuck wood?",
        "Betty Botter bought some butter but she said the butter's bitter.",
    };
    return sentences;
}

std::vector<std::string> exercise_categories() {
    std::vector<std::string> out;
    for (const auto& kv : exercise_table()) out.push_back(kv.first);
    return out;
}

std::vector<std::string> exercise_sentences(const std::string& category) {
    auto it = exercise_table().find(category);
    if (it == exercise_table().end()) return {};
    return it->second;
}
}
