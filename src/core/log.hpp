#pragma once
#include <string>

// Process-wide diagnostics. Lines go to stderr with a "[Flight]" prefix and are
// appended to the log file when one is configured (useful when the tool runs
// detached from a terminal).

void set_log_file(const std::string& path);   // empty path disables the file sink
void set_verbose_logging(bool enabled);
bool verbose_logging();

void log_info(const std::string& s);
void log_warn(const std::string& s);
// Per-report chatter; dropped unless verbose logging is enabled
void log_verbose(const std::string& s);
