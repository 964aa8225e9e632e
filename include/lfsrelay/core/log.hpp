#pragma once

#include <filesystem>

namespace lfsrelay {

// stdout carries the git-lfs protocol, so log output goes to stderr
// unless a log file has been opened.
bool open_log_file(const std::filesystem::path& path);
void close_log_file();
void set_verbose(bool verbose);

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace lfsrelay
