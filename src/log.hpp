#pragma once

#include <cstdarg>
#include <string>

namespace cdihook {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

void log_init(const char* tag);
void log_set_level(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);
void log_v(const char* fmt, ...);
void log_d(const char* fmt, ...);
void log_i(const char* fmt, ...);
void log_w(const char* fmt, ...);
void log_e(const char* fmt, ...);

// Helper macros
#define LOGV(...) cdihook::log_v(__VA_ARGS__)
#define LOGD(...) cdihook::log_d(__VA_ARGS__)
#define LOGI(...) cdihook::log_i(__VA_ARGS__)
#define LOGW(...) cdihook::log_w(__VA_ARGS__)
#define LOGE(...) cdihook::log_e(__VA_ARGS__)

}  // namespace cdihook
