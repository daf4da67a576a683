#include <siteguard/core/logging.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace siteguard::core {

namespace {

struct LoggingState {
  std::atomic<LogLevel> level{LogLevel::Info};
  std::ostream* sink{nullptr};
  std::mutex mutex;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::string_view level_name(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Off:
      break;
  }
  return "OFF";
}

std::string timestamp_utc() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
  std::string n(name);
  std::transform(n.begin(), n.end(), n.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (n == "debug") return LogLevel::Debug;
  if (n == "info") return LogLevel::Info;
  if (n == "warn" || n == "warning") return LogLevel::Warn;
  if (n == "error") return LogLevel::Error;
  if (n == "off") return LogLevel::Off;
  return std::nullopt;
}

void set_log_level(LogLevel level) noexcept { state().level.store(level); }

LogLevel log_level() noexcept { return state().level.load(); }

void set_log_sink(std::ostream* sink) {
  auto& s = state();
  std::lock_guard lock(s.mutex);
  s.sink = sink;
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

bool Logger::enabled(LogLevel level) const noexcept {
  return level != LogLevel::Off &&
         static_cast<int>(level) >= static_cast<int>(log_level());
}

void Logger::log(LogLevel level, std::string_view message) const {
  if (!enabled(level)) return;

  std::ostringstream line;
  line << timestamp_utc() << ' ' << level_name(level) << " [" << name_ << "] "
       << message << '\n';

  auto& s = state();
  std::lock_guard lock(s.mutex);
  std::ostream& out = s.sink ? *s.sink : std::cerr;
  out << line.str();
  out.flush();
}

}  // namespace siteguard::core
