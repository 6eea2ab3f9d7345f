#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

// stdout carries protocol traffic only; every diagnostic goes to stderr.
enum class LogLevel : int { Quiet = 0, Info = 1, Debug = 2 };

inline LogLevel& logLevelRef() {
  static LogLevel level = LogLevel::Info;
  return level;
}

inline void setLogLevel(LogLevel l) { logLevelRef() = l; }
inline LogLevel logLevel() { return logLevelRef(); }

// VMMCP_DEBUG=1|true|debug raises verbosity to Debug. Read once at startup.
inline bool debugRequestedByEnv() {
  const char* v = std::getenv("VMMCP_DEBUG");
  if (!v) return false;
  return std::strcmp(v, "1") == 0 || std::strcmp(v, "true") == 0 || std::strcmp(v, "TRUE") == 0 ||
         std::strcmp(v, "debug") == 0 || std::strcmp(v, "DEBUG") == 0;
}

inline void vlogLine(const char* tag, const char* fmt, va_list ap) {
  std::fprintf(stderr, "vmmcp: %s", tag);
  std::vfprintf(stderr, fmt, ap);
  std::fputc('\n', stderr);
  std::fflush(stderr);
}

inline void logError(const char* fmt, ...) {
  va_list ap; va_start(ap, fmt);
  vlogLine("error: ", fmt, ap);
  va_end(ap);
}

inline void logWarn(const char* fmt, ...) {
  if (logLevel() < LogLevel::Info) return;
  va_list ap; va_start(ap, fmt);
  vlogLine("warning: ", fmt, ap);
  va_end(ap);
}

inline void logInfo(const char* fmt, ...) {
  if (logLevel() < LogLevel::Info) return;
  va_list ap; va_start(ap, fmt);
  vlogLine("", fmt, ap);
  va_end(ap);
}

inline void logDebug(const char* fmt, ...) {
  if (logLevel() < LogLevel::Debug) return;
  va_list ap; va_start(ap, fmt);
  vlogLine("debug: ", fmt, ap);
  va_end(ap);
}
