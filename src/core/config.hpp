#pragma once
#include <string>

namespace core {
struct Config {
    std::string rubric_path;  // PRONOUNCE_RUBRIC; empty = built-in defaults
    bool verbose = false;     // PRONOUNCE_DEBUG
};

// Read once from the environment on first use.
const Config& get_config();
}
