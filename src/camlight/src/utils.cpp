#include "utils.hpp"
#include <cstdarg>
#include <cstdio>
#include <iomanip>
#include <mutex>
#include <sstream>

std::string now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm); // thread-safe
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0)
        return std::string();
    return std::string(buf);
}

std::string now_timestamp_filename() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

static std::mutex g_log_m;

static void vlog(FILE* out, const char* level, const char* fmt, va_list ap) {
    std::string ts = now_timestamp();
    std::lock_guard<std::mutex> lk(g_log_m);
    fprintf(out, "[%s] %-5s ", ts.c_str(), level);
    vfprintf(out, fmt, ap);
    fputc('\n', out);
    fflush(out);
}

void log_info(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    vlog(stdout, "INFO", fmt, ap);
    va_end(ap);
}

void log_warn(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    vlog(stderr, "WARN", fmt, ap);
    va_end(ap);
}

void log_error(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    vlog(stderr, "ERROR", fmt, ap);
    va_end(ap);
}
