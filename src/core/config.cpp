#include "core/config.hpp"
#include <cstdlib>
#include <cstring>

namespace core {

static Config load_from_env() {
    Config cfg;
    if (const char* p = std::getenv("PRONOUNCE_RUBRIC")) cfg.rubric_path = p;
    const char* dbg = std::getenv("PRONOUNCE_DEBUG");
    cfg.verbose = dbg != nullptr && std::strcmp(dbg, "0") != 0 && dbg[0] != '\0';
    return cfg;
}

const Config& get_config() {
    static const Config cfg = load_from_env();
    return cfg;
}
}
