#include "lfsrelay/core/log.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <system_error>

namespace lfsrelay {

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;
bool g_verbose = false;

void vlog(const char* level, const char* fmt, va_list args) {
    std::lock_guard lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;

    std::time_t now = std::time(nullptr);
    std::tm tm_buf;
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    fprintf(out, "%s %s: ", stamp, level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

bool open_log_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return false;
    }
    FILE* f = fopen(path.c_str(), "a");
    if (!f) return false;

    std::lock_guard lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = f;
    return true;
}

void close_log_file() {
    std::lock_guard lock(g_log_mutex);
    if (g_log_file) {
        fclose(g_log_file);
        g_log_file = nullptr;
    }
}

void set_verbose(bool verbose) {
    std::lock_guard lock(g_log_mutex);
    g_verbose = verbose;
}

void log_debug(const char* fmt, ...) {
    {
        std::lock_guard lock(g_log_mutex);
        if (!g_verbose) return;
    }
    va_list args;
    va_start(args, fmt);
    vlog("DEBUG", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog("INFO", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog("WARN", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog("ERROR", fmt, args);
    va_end(args);
}

}  // namespace lfsrelay
