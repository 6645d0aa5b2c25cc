#pragma once

#include <string>

namespace diarclip {

// Process log lines on stderr: "2026-01-31 12:00:00 - INFO - message".
// stdout stays free for the JSON the CLI prints.

void log_info(const std::string &msg);
void log_warn(const std::string &msg);
void log_error(const std::string &msg);

// Drop INFO lines (--quiet). WARN and ERROR are always written.
void set_info_logging(bool enabled);

} // namespace diarclip
