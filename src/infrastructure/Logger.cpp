// Logger.cpp

#include "Logger.h"

#include <stdio.h>

LogLevel Logger::currentLevel_ = LOG_LEVEL_INFO;
Logger::Sink Logger::sink_ = nullptr;

void Logger::printFormatted(const char* level, const char* fmt, va_list args) {
  if (!sink_) return;
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  sink_(level, buffer);
}
