#include "core/logging.hpp"
#include "core/config.hpp"
#include <atomic>
#include <iostream>

namespace core {
namespace {
// -1 = not decided yet, fall back to the environment
std::atomic<int> g_verbose{-1};
}

void set_verbose(bool on) { g_verbose.store(on ? 1 : 0); }

bool is_verbose() {
    int v = g_verbose.load();
    if (v < 0) return get_config().verbose;
    return v == 1;
}

// stdout carries reports, so every level goes to stderr
void log_info(const std::string& msg) { std::cerr << "[INFO] " << msg << std::endl; }
void log_warn(const std::string& msg) { std::cerr << "[WARN] " << msg << std::endl; }
void log_error(const std::string& msg) { std::cerr << "[ERROR] " << msg << std::endl; }
void log_debug(const std::string& msg) {
    if (is_verbose()) std::cerr << "[DEBUG] " << msg << std::endl;
}
}
