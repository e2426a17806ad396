#pragma once
#include <string>
#include <ctime>

std::string now_timestamp();            // e.g. "2025-08-16 14:32:10"
std::string now_timestamp_filename();   // e.g. 20250815_123456

// printf-style log lines: "[2025-08-16 14:32:10] INFO  message"
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
