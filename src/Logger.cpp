module;
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
module Logger;
using namespace Luminary;

std::optional<LogLevel> Luminary::parseLogLevel(std::string_view name) noexcept {
  std::string lower(name);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
  if (lower == "error") return LogLevel::Error;
  if (lower == "warning" || lower == "warn") return LogLevel::Warning;
  if (lower == "info") return LogLevel::Info;
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "trace") return LogLevel::Trace;
  return std::nullopt;
}

std::string_view Luminary::toString(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Error:
      return "error";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Info:
      return "info";
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Trace:
      return "trace";
  }
  return "unknown";
}

Logger::Logger(LogLevel level) noexcept : _level(level) {}

void Logger::setLevel(LogLevel level) noexcept { _level = level; }

LogLevel Logger::getLevel() const noexcept { return _level; }

bool Logger::isEnabled(LogLevel level) const noexcept { return level <= _level; }

void Logger::log(LogLevel level, std::string_view category, std::string_view message) const {
  if (isEnabled(level)) _write(level, category, message);
}

ConsoleLogger::ConsoleLogger(LogLevel level, bool colors) noexcept : Logger(level), _colors(colors) {}

void ConsoleLogger::_write(LogLevel level, std::string_view category, std::string_view message) const {
  const char* color = "";
  switch (level) {
    case LogLevel::Error:
      color = "\033[31m";
      break;
    case LogLevel::Warning:
      color = "\033[33m";
      break;
    case LogLevel::Info:
      color = "\033[32m";
      break;
    case LogLevel::Debug:
    case LogLevel::Trace:
      color = "\033[90m";
      break;
  }

  std::lock_guard lock(_mutex);
  auto stream = level <= LogLevel::Warning ? stderr : stdout;
  if (_colors) {
    fprintf(stream, "%s[%.*s] [%.*s] %.*s\033[0m\n", color, static_cast<int>(toString(level).size()),
            toString(level).data(), static_cast<int>(category.size()), category.data(),
            static_cast<int>(message.size()), message.data());
  } else {
    fprintf(stream, "[%.*s] [%.*s] %.*s\n", static_cast<int>(toString(level).size()), toString(level).data(),
            static_cast<int>(category.size()), category.data(), static_cast<int>(message.size()), message.data());
  }
  fflush(stream);
}
