#pragma once

#include <string>
#include <string_view>

namespace haul::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool logEnabled(LogLevel level);

std::string_view toString(LogLevel level);

// Accepts trace|debug|info|warn|error|off (case-insensitive, surrounding blanks ignored).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Optional callback sink for log messages.
//
// Sinks are invoked after the message has been written to stderr.
// The timestamp and message views are only valid for the duration of the callback.
struct LogSink {
  using Fn = void (*)(LogLevel level, std::string_view timestamp, std::string_view message, void* user);
  Fn fn{nullptr};
  void* user{nullptr};
};

void addLogSink(LogSink sink);
void removeLogSink(LogSink sink);

// When false, messages only reach the sinks (tests, batch runs that capture output).
void setLogToStderr(bool enabled);

void log(LogLevel level, std::string_view message);

// Same as log(), prefixed with "[tag] ". Route computations tag their lines with the
// request label so interleaved batch output stays readable.
void logTagged(LogLevel level, std::string_view tag, std::string_view message);

// Temporarily overrides the global level, restoring the previous one on scope exit.
class ScopedLogLevel {
public:
  explicit ScopedLogLevel(LogLevel level) : prev_(getLogLevel()) { setLogLevel(level); }
  ~ScopedLogLevel() { setLogLevel(prev_); }

  ScopedLogLevel(const ScopedLogLevel&) = delete;
  ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
  LogLevel prev_;
};

} // namespace haul::core

#define HAUL_LOG_TRACE(msg) ::haul::core::log(::haul::core::LogLevel::Trace, (msg))
#define HAUL_LOG_DEBUG(msg) ::haul::core::log(::haul::core::LogLevel::Debug, (msg))
#define HAUL_LOG_INFO(msg)  ::haul::core::log(::haul::core::LogLevel::Info,  (msg))
#define HAUL_LOG_WARN(msg)  ::haul::core::log(::haul::core::LogLevel::Warn,  (msg))
#define HAUL_LOG_ERROR(msg) ::haul::core::log(::haul::core::LogLevel::Error, (msg))
