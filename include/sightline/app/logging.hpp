#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace sightline::app {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warn,
  Error,
};

enum class LogFormat : std::uint8_t {
  Pretty,
  Json,
};

/// Process-wide line logger for the application layer (CLI, live loop,
/// config watcher). The detection library itself does not log.
/// Warn and Error go to stderr, the rest to stdout; lines never interleave.
class Logger {
 public:
  /// Reads SIGHTLINE_LOG_FORMAT (pretty|json) and SIGHTLINE_LOG_LEVEL
  /// (debug|info|warn|error). Safe to call more than once.
  static void init();

  static void set_level(LogLevel level) noexcept;
  static void set_format(LogFormat format) noexcept;
  [[nodiscard]] static bool enabled(LogLevel level) noexcept;

  static void log(LogLevel level, std::string_view message, std::string_view target = {});

  /// One formatted line, without trailing newline. Exposed for tests.
  [[nodiscard]] static std::string format_line(LogLevel level, std::string_view message,
                                               std::string_view target);

 private:
  static std::mutex mutex_;
};

[[nodiscard]] const char* to_string(LogLevel level) noexcept;

}  // namespace sightline::app

#define SIGHTLINE_LOG_DEBUG(msg) \
  ::sightline::app::Logger::log(::sightline::app::LogLevel::Debug, (msg))
#define SIGHTLINE_LOG_INFO(msg) \
  ::sightline::app::Logger::log(::sightline::app::LogLevel::Info, (msg))
#define SIGHTLINE_LOG_WARN(msg) \
  ::sightline::app::Logger::log(::sightline::app::LogLevel::Warn, (msg))
#define SIGHTLINE_LOG_ERROR(msg) \
  ::sightline::app::Logger::log(::sightline::app::LogLevel::Error, (msg))
