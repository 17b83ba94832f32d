#pragma once
#include <string>

namespace core {

// Debug output is off unless enabled here or through PRONOUNCE_DEBUG.
void set_verbose(bool on);
bool is_verbose();

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
void log_debug(const std::string& msg);
}
