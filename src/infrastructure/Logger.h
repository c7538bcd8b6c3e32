// Logger.h
// Minimal leveled logger shared by the domain and the ESP32 drivers.
// Output goes through a C-style sink so the same calls work on the device
// (Serial) and in host builds (dropped unless a test installs a sink).

#pragma once

#include <stdarg.h>

enum LogLevel {
  LOG_LEVEL_ERROR = 0,
  LOG_LEVEL_WARN = 1,
  LOG_LEVEL_INFO = 2,
  LOG_LEVEL_DEBUG = 3,
};

class Logger {
 public:
  // Receives one formatted line; `level` is "E", "W", "I" or "D".
  using Sink = void (*)(const char* level, const char* line);

  static void setLevel(LogLevel level) { currentLevel_ = level; }
  static LogLevel level() { return currentLevel_; }
  static void setSink(Sink sink) { sink_ = sink; }

  static void error(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_ERROR) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("E", fmt, args);
    va_end(args);
  }

  static void warn(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_WARN) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("W", fmt, args);
    va_end(args);
  }

  static void info(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_INFO) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("I", fmt, args);
    va_end(args);
  }

  static void debug(const char* fmt, ...) {
    if (currentLevel_ < LOG_LEVEL_DEBUG) return;
    va_list args;
    va_start(args, fmt);
    printFormatted("D", fmt, args);
    va_end(args);
  }

 private:
  static void printFormatted(const char* level, const char* fmt, va_list args);

  static LogLevel currentLevel_;
  static Sink sink_;
};
