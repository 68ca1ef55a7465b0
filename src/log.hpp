#pragma once
/*
 * Log
 *
 * Purpose: process-wide line logger, "<time> LEVEL [component] message".
 * Sink: stderr by default; a file once the curses screen is up (stderr would
 * draw over the UI). Logging never reports failure to the caller.
 */
#include <filesystem>
#include <string>

enum class LogLevel { Info, Warn, Error };

void log_to_stderr();
// falls back to a null sink when the file cannot be opened
bool log_to_file(const std::filesystem::path& path);
void log_disable();

void log_write(LogLevel level, const std::string& component, const std::string& msg);

inline void log_info(const std::string& component, const std::string& msg) { log_write(LogLevel::Info, component, msg); }
inline void log_warn(const std::string& component, const std::string& msg) { log_write(LogLevel::Warn, component, msg); }
inline void log_error(const std::string& component, const std::string& msg) { log_write(LogLevel::Error, component, msg); }
