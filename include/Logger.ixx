module;
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
export module Logger;

export namespace Luminary {
enum class LogLevel { Error = 0, Warning, Info, Debug, Trace };

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;
std::string_view toString(LogLevel level) noexcept;

class Logger {
 private:
  LogLevel _level;

 protected:
  virtual void _write(LogLevel level, std::string_view category, std::string_view message) const = 0;

 public:
  Logger(LogLevel level) noexcept;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void setLevel(LogLevel level) noexcept;
  LogLevel getLevel() const noexcept;
  bool isEnabled(LogLevel level) const noexcept;
  void log(LogLevel level, std::string_view category, std::string_view message) const;

  template <class... Args>
  void error(std::string_view category, std::format_string<Args...> format, Args&&... args) const {
    if (isEnabled(LogLevel::Error)) _write(LogLevel::Error, category, std::format(format, std::forward<Args>(args)...));
  }
  template <class... Args>
  void warning(std::string_view category, std::format_string<Args...> format, Args&&... args) const {
    if (isEnabled(LogLevel::Warning))
      _write(LogLevel::Warning, category, std::format(format, std::forward<Args>(args)...));
  }
  template <class... Args>
  void info(std::string_view category, std::format_string<Args...> format, Args&&... args) const {
    if (isEnabled(LogLevel::Info)) _write(LogLevel::Info, category, std::format(format, std::forward<Args>(args)...));
  }
  template <class... Args>
  void debug(std::string_view category, std::format_string<Args...> format, Args&&... args) const {
    if (isEnabled(LogLevel::Debug)) _write(LogLevel::Debug, category, std::format(format, std::forward<Args>(args)...));
  }
  template <class... Args>
  void trace(std::string_view category, std::format_string<Args...> format, Args&&... args) const {
    if (isEnabled(LogLevel::Trace)) _write(LogLevel::Trace, category, std::format(format, std::forward<Args>(args)...));
  }

  virtual ~Logger() = default;
};

// validation layer may call from driver threads, so writes are serialized
class ConsoleLogger final : public Logger {
 private:
  mutable std::mutex _mutex;
  bool _colors;

 protected:
  void _write(LogLevel level, std::string_view category, std::string_view message) const override;

 public:
  ConsoleLogger(LogLevel level, bool colors = true) noexcept;
};
}  // namespace Luminary
