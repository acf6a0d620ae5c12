#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace marker_motion {

// Shared "marker_motion" logger. Created on first use, writing to stderr.
std::shared_ptr<spdlog::logger> motion_logger();

// Redirects the logger into a file (truncated on open). Returns false and
// keeps the current sink if the file cannot be opened.
bool set_motion_log_file(const std::string& path);

} // namespace marker_motion
