#include "Branchline/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define BRANCHLINE_ISATTY _isatty
#define BRANCHLINE_FILENO _fileno
#else
#include <unistd.h>
#define BRANCHLINE_ISATTY isatty
#define BRANCHLINE_FILENO fileno
#endif

namespace Branchline::core {

namespace {

const char* levelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
    return "\033[31m";
  case LogLevel::Fatal:
    return "\033[1;31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace")
    return LogLevel::Trace;
  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "fatal")
    return LogLevel::Fatal;
  if (lower == "off" || lower == "none")
    return LogLevel::Off;
  return std::nullopt;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger()
    : m_level(LogLevel::Info), m_consoleOutput(true),
      m_useColors(BRANCHLINE_ISATTY(BRANCHLINE_FILENO(stderr)) != 0) {}

Logger::~Logger() { closeOutputFile(); }

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

bool Logger::isEnabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return level != LogLevel::Off && level >= m_level;
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_consoleOutput = enabled;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

Logger::CallbackId Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  CallbackId id = m_nextCallbackId++;
  m_callbacks.emplace_back(id, std::move(callback));
  return id;
}

void Logger::removeLogCallback(CallbackId id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.erase(std::remove_if(m_callbacks.begin(), m_callbacks.end(),
                                   [id](const auto& entry) { return entry.first == id; }),
                    m_callbacks.end());
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || level < m_level) {
      return;
    }

    const std::string line =
        "[" + getCurrentTimestamp() + "] [" + logLevelName(level) + "] " + std::string(message);

    if (m_consoleOutput) {
      if (m_useColors) {
        std::cerr << levelColor(level) << line << "\033[0m\n";
      } else {
        std::cerr << line << "\n";
      }
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << "\n";
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    callbacks.reserve(m_callbacks.size());
    for (const auto& entry : m_callbacks) {
      callbacks.push_back(entry.second);
    }
  }

  // Callbacks run outside the lock so they may log themselves
  const std::string text(message);
  for (const auto& callback : callbacks) {
    callback(level, text);
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &time);
#else
  localtime_r(&time, &tm);
#endif

  std::ostringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

} // namespace Branchline::core
