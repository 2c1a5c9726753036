/*
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License version 2 for more details.
 *
 * You should have received a copy of the GNU General Public License
 * version 2 along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 *
 */

/*
 * Structured logging for the icmd driver
 *
 * Features:
 * - Console or file output based on startup flags
 * - RT-safe logging via lock-free queue (sampler thread)
 * - Log levels (debug, info, warn, error)
 * - File/line information in debug mode
 * - Type-safe formatting via tinyformat
 */

#pragma once

#include <string>
#include <tinyformat.h>

namespace icmd {
namespace log {

// Log levels in order of severity
enum class Level {
    LVL_DEBUG,   // Named to avoid conflict with DEBUG macro
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR
};

// Configuration for log initialization
struct Config {
    bool use_file = false;              // Output to file instead of console
    const char* file_path = nullptr;    // Custom file path (nullptr = default)
    Level min_level = Level::LVL_INFO;  // Minimum level to log
};

// Initialize logging system (call once at startup)
void init(const Config& config);

// Shutdown logging system (call at exit)
void shutdown();

// Flush RT log queue (call from main thread periodically)
void flush_rt_logs();

// Check if a level would be logged (useful to avoid expensive formatting)
bool would_log(Level level);

// Get level name as string
const char* level_name(Level level);

// Parse "debug", "info", "warn", "error"; returns false on anything else
bool parse_level(const char* str, Level* level);

// Low-level write functions (used by template functions below)
void write_message(Level level, const char* file, int line, const std::string& message);
void write_message_rt(Level level, const std::string& message);

template<typename... Args>
void log_debug(const char* file, int line, const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_DEBUG)) return;
    write_message(Level::LVL_DEBUG, file, line, tfm::format(fmt, args...));
}

template<typename... Args>
void log_info(const char* file, int line, const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_INFO)) return;
    write_message(Level::LVL_INFO, file, line, tfm::format(fmt, args...));
}

template<typename... Args>
void log_warn(const char* file, int line, const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_WARN)) return;
    write_message(Level::LVL_WARN, file, line, tfm::format(fmt, args...));
}

template<typename... Args>
void log_error(const char* file, int line, const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_ERROR)) return;
    write_message(Level::LVL_ERROR, file, line, tfm::format(fmt, args...));
}

// RT-safe logging: formatted on the calling thread, written by flush_rt_logs()
template<typename... Args>
void log_info_rt(const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_INFO)) return;
    write_message_rt(Level::LVL_INFO, tfm::format(fmt, args...));
}

template<typename... Args>
void log_warn_rt(const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_WARN)) return;
    write_message_rt(Level::LVL_WARN, tfm::format(fmt, args...));
}

template<typename... Args>
void log_error_rt(const char* fmt, const Args&... args) {
    if (!would_log(Level::LVL_ERROR)) return;
    write_message_rt(Level::LVL_ERROR, tfm::format(fmt, args...));
}

} // namespace log
} // namespace icmd

#define LOG_DEBUG(...) ::icmd::log::log_debug(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_INFO(...)  ::icmd::log::log_info(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_WARN(...)  ::icmd::log::log_warn(__FILE__, __LINE__, __VA_ARGS__)
#define LOG_ERROR(...) ::icmd::log::log_error(__FILE__, __LINE__, __VA_ARGS__)

#define LOG_RT_INFO(...)  ::icmd::log::log_info_rt(__VA_ARGS__)
#define LOG_RT_WARN(...)  ::icmd::log::log_warn_rt(__VA_ARGS__)
#define LOG_RT_ERROR(...) ::icmd::log::log_error_rt(__VA_ARGS__)
