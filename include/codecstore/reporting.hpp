#pragma once
#include <string>

namespace codecstore {
namespace reporting {

// Listing format used by codecstore_dump.
void set_csv(bool value);
bool csv_enabled();

// Debug lines are also enabled by CODECSTORE_DEBUG=1 in the environment.
void set_debug(bool value);
bool debug_enabled();

// Tagged log lines: "[tag] msg". info/debug go to stdout, warn/error to stderr.
void info(const char* tag, const std::string& msg);
void warn(const char* tag, const std::string& msg);
void error(const char* tag, const std::string& msg);
void debug(const char* tag, const std::string& msg);

} // namespace reporting
} // namespace codecstore
