#include <sightline/app/logging.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace sightline::app {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<LogFormat> g_format{LogFormat::Pretty};

std::string timestamp() {
  const auto now = std::chrono::system_clock::now();
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  const std::time_t timer = std::chrono::system_clock::to_time_t(now);
  std::tm bt{};
  localtime_r(&timer, &bt);

  std::ostringstream oss;
  oss << std::put_time(&bt, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string escape_json(std::string_view s) {
  std::ostringstream o;
  for (const char c : s) {
    switch (c) {
      case '"': o << "\\\""; break;
      case '\\': o << "\\\\"; break;
      case '\n': o << "\\n"; break;
      case '\r': o << "\\r"; break;
      case '\t': o << "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(c) << std::dec;
        } else {
          o << c;
        }
    }
  }
  return o.str();
}

}  // namespace

std::mutex Logger::mutex_;

const char* to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::init() {
  const char* format = std::getenv("SIGHTLINE_LOG_FORMAT");
  if (format && std::string_view(format) == "json") {
    set_format(LogFormat::Json);
  } else {
    set_format(LogFormat::Pretty);
  }

  const char* level = std::getenv("SIGHTLINE_LOG_LEVEL");
  if (!level) return;
  const std::string_view l(level);
  if (l == "debug") set_level(LogLevel::Debug);
  else if (l == "info") set_level(LogLevel::Info);
  else if (l == "warn") set_level(LogLevel::Warn);
  else if (l == "error") set_level(LogLevel::Error);
}

void Logger::set_level(LogLevel level) noexcept { g_level = level; }

void Logger::set_format(LogFormat format) noexcept { g_format = format; }

bool Logger::enabled(LogLevel level) noexcept {
  return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

std::string Logger::format_line(LogLevel level, std::string_view message,
                                std::string_view target) {
  std::ostringstream line;
  if (g_format.load() == LogFormat::Json) {
    line << "{\"timestamp\":\"" << timestamp() << "\","
         << "\"level\":\"" << to_string(level) << "\","
         << "\"message\":\"" << escape_json(message) << "\"";
    if (!target.empty()) {
      line << ",\"target\":\"" << escape_json(target) << "\"";
    }
    line << "}";
  } else {
    line << timestamp() << " " << to_string(level) << " ";
    if (!target.empty()) line << "[" << target << "] ";
    line << message;
  }
  return line.str();
}

void Logger::log(LogLevel level, std::string_view message, std::string_view target) {
  if (!enabled(level)) return;
  const std::string line = format_line(level, message, target);

  std::lock_guard lock(mutex_);
  std::ostream& stream =
      (level == LogLevel::Error || level == LogLevel::Warn) ? std::cerr : std::cout;
  stream << line << '\n';
  stream.flush();
}

}  // namespace sightline::app
