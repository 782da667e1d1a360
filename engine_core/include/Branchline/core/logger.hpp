#pragma once

#include "Branchline/core/types.hpp"
#include <cstdio>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Branchline::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning"/"warn",
 * "error", "fatal", "off"), case-insensitive
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

[[nodiscard]] const char* logLevelName(LogLevel level);

/**
 * @brief Process-wide logger
 *
 * Messages go to stderr (colored when attached to a terminal), to an
 * optional log file, and to any registered callbacks. A host embedding the
 * engine typically registers a callback to route engine messages into its
 * own log sink.
 */
class Logger {
public:
  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  using CallbackId = u32;

  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;
  [[nodiscard]] bool isEnabled(LogLevel level) const;

  void setConsoleOutput(bool enabled);

  /**
   * @brief Append log lines to a file (opened in append mode)
   * @return false if the file could not be opened
   */
  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  CallbackId addLogCallback(LogCallback callback);
  void removeLogCallback(CallbackId id);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message) { log(LogLevel::Trace, message); }
  void debug(std::string_view message) { log(LogLevel::Debug, message); }
  void info(std::string_view message) { log(LogLevel::Info, message); }
  void warning(std::string_view message) { log(LogLevel::Warning, message); }
  void error(std::string_view message) { log(LogLevel::Error, message); }
  void fatal(std::string_view message) { log(LogLevel::Fatal, message); }

  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Trace))
      log(LogLevel::Trace, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Debug))
      log(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Info))
      log(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Warning))
      log(LogLevel::Warning, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Error))
      log(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    if (isEnabled(LogLevel::Fatal))
      log(LogLevel::Fatal, std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger();
  ~Logger();

  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  bool m_consoleOutput;
  bool m_useColors;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  std::vector<std::pair<CallbackId, LogCallback>> m_callbacks;
  CallbackId m_nextCallbackId = 1;
};

} // namespace Branchline::core

#define BRANCHLINE_LOG_TRACE(...) ::Branchline::core::Logger::instance().trace(__VA_ARGS__)
#define BRANCHLINE_LOG_DEBUG(...) ::Branchline::core::Logger::instance().debug(__VA_ARGS__)
#define BRANCHLINE_LOG_INFO(...) ::Branchline::core::Logger::instance().info(__VA_ARGS__)
#define BRANCHLINE_LOG_WARN(...) ::Branchline::core::Logger::instance().warning(__VA_ARGS__)
#define BRANCHLINE_LOG_ERROR(...) ::Branchline::core::Logger::instance().error(__VA_ARGS__)
#define BRANCHLINE_LOG_FATAL(...) ::Branchline::core::Logger::instance().fatal(__VA_ARGS__)
