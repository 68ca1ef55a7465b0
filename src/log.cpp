#include "log.hpp"
#include "timestamp.hpp"
#include <fstream>
#include <iostream>
#include <system_error>

namespace {
enum class Sink { Stderr, File, Null };

struct LogState {
  Sink sink = Sink::Stderr;
  std::ofstream file;
};

LogState& state() {
  static LogState s;
  return s;
}

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "?";
}
}

void log_to_stderr() {
  auto& s = state();
  if (s.file.is_open()) s.file.close();
  s.sink = Sink::Stderr;
}

bool log_to_file(const std::filesystem::path& path) {
  auto& s = state();
  if (s.file.is_open()) s.file.close();
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  s.file.open(path, std::ios::out | std::ios::app);
  if (!s.file.is_open()) {
    s.sink = Sink::Null;
    return false;
  }
  s.sink = Sink::File;
  return true;
}

void log_disable() {
  auto& s = state();
  if (s.file.is_open()) s.file.close();
  s.sink = Sink::Null;
}

void log_write(LogLevel level, const std::string& component, const std::string& msg) {
  auto& s = state();
  if (s.sink == Sink::Null) return;
  std::string line = format_timestamp(now_timestamp()) + " " + level_name(level) + " [" + component + "] " + msg;
  if (s.sink == Sink::File) {
    s.file << line << '\n';
    s.file.flush();
  } else {
    std::cerr << line << '\n';
  }
}
