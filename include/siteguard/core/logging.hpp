#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace siteguard::core {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Process-wide minimum level. Default: Info.
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// Redirect output (e.g. to a std::ostringstream in tests). nullptr restores std::cerr.
/// The stream must outlive all logging calls made while it is installed.
void set_log_sink(std::ostream* sink);

/// Named component logger. Cheap to copy; lines are written atomically.
class Logger {
 public:
  explicit Logger(std::string name);

  void log(LogLevel level, std::string_view message) const;

  void debug(std::string_view message) const { log(LogLevel::Debug, message); }
  void info(std::string_view message) const { log(LogLevel::Info, message); }
  void warn(std::string_view message) const { log(LogLevel::Warn, message); }
  void error(std::string_view message) const { log(LogLevel::Error, message); }

  [[nodiscard]] bool enabled(LogLevel level) const noexcept;
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

 private:
  std::string name_;
};

}  // namespace siteguard::core
