/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "Branchline/runtime/config_manager.hpp"
#include "Branchline/core/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

namespace fs = std::filesystem;

namespace Branchline::runtime {

// Minimal JSON reading for flat configuration objects
namespace json {

inline std::string trim(const std::string& s) {
  auto start = s.find_first_not_of(" \t\n\r");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\n\r");
  return s.substr(start, end - start + 1);
}

/// Position of the first character of the value stored under "key"
inline std::optional<usize> findValue(const std::string& json, const std::string& key) {
  const std::string quoted = "\"" + key + "\"";
  usize searchFrom = 0;
  while (true) {
    auto keyPos = json.find(quoted, searchFrom);
    if (keyPos == std::string::npos)
      return std::nullopt;

    auto colonPos = json.find_first_not_of(" \t\n\r", keyPos + quoted.size());
    if (colonPos != std::string::npos && json[colonPos] == ':') {
      auto valueStart = json.find_first_not_of(" \t\n\r", colonPos + 1);
      if (valueStart == std::string::npos)
        return std::nullopt;
      return valueStart;
    }
    // The key text appeared as a value; keep looking
    searchFrom = keyPos + quoted.size();
  }
}

inline std::optional<std::string> extractString(const std::string& json, const std::string& key) {
  auto pos = findValue(json, key);
  if (!pos || json[*pos] != '"')
    return std::nullopt;

  std::string out;
  for (usize i = *pos + 1; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"')
      return out;
    if (c == '\\' && i + 1 < json.size()) {
      char esc = json[++i];
      switch (esc) {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      default:
        out += esc;
        break;
      }
      continue;
    }
    out += c;
  }
  return std::nullopt;
}

inline std::optional<i64> extractInt(const std::string& json, const std::string& key) {
  auto pos = findValue(json, key);
  if (!pos)
    return std::nullopt;

  const char* begin = json.c_str() + *pos;
  char* end = nullptr;
  errno = 0;
  const long long value = std::strtoll(begin, &end, 10);
  if (end == begin || errno == ERANGE)
    return std::nullopt;
  return static_cast<i64>(value);
}

inline std::optional<bool> extractBool(const std::string& json, const std::string& key) {
  auto pos = findValue(json, key);
  if (!pos)
    return std::nullopt;
  if (json.compare(*pos, 4, "true") == 0)
    return true;
  if (json.compare(*pos, 5, "false") == 0)
    return false;
  return std::nullopt;
}

inline std::string extractObject(const std::string& json, const std::string& key) {
  auto pos = findValue(json, key);
  if (!pos || json[*pos] != '{')
    return "";

  int depth = 0;
  bool inString = false;
  for (usize i = *pos; i < json.size(); ++i) {
    const char c = json[i];
    if (inString) {
      if (c == '\\')
        ++i;
      else if (c == '"')
        inString = false;
      continue;
    }
    if (c == '"')
      inString = true;
    else if (c == '{')
      ++depth;
    else if (c == '}' && --depth == 0)
      return json.substr(*pos, i - *pos + 1);
  }
  return "";
}

inline std::string escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out += c;
      break;
    }
  }
  return out;
}

} // namespace json

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::initialize(const std::string& basePath) {
  m_basePath = basePath;
  if (!m_basePath.empty() && m_basePath.back() != '/' && m_basePath.back() != '\\') {
    m_basePath += '/';
  }
  m_initialized = true;
  return Result<void>::ok();
}

Result<void> ConfigManager::loadConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  m_config = EngineConfig();
  m_baseConfig = EngineConfig();

  const std::string basePath = getConfigPath() + "engine_config.json";
  if (fs::exists(basePath)) {
    auto result = loadFromFile(basePath);
    if (result.isError()) {
      return result;
    }
    m_baseConfig = m_config;
  } else {
    BRANCHLINE_LOG_INFO("No engine_config.json in {}, using defaults", getConfigPath());
  }

  const std::string userPath = getConfigPath() + "engine_user.json";
  if (fs::exists(userPath)) {
    auto result = loadFromFile(userPath);
    if (result.isError()) {
      return result;
    }
  }

  BRANCHLINE_LOG_INFO("Configuration loaded");
  return Result<void>::ok();
}

Result<void> ConfigManager::loadConfigFile(const std::string& path) {
  return loadFromFile(path);
}

Result<void> ConfigManager::applyJson(const std::string& json) {
  return parseJson(json, m_config);
}

Result<void> ConfigManager::saveUserConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  const std::string userConfigPath = getConfigPath() + "engine_user.json";
  std::error_code ec;
  fs::create_directories(getConfigPath(), ec);
  if (ec) {
    return Result<void>::error("Cannot create " + getConfigPath() + ": " + ec.message());
  }

  // Write to a temporary file first so a failed write never truncates the old one
  const std::string tempPath = userConfigPath + ".tmp";
  {
    std::ofstream file(tempPath);
    if (!file.is_open()) {
      return Result<void>::error("Cannot open file for writing: " + tempPath);
    }
    file << serializeToJson(true);
    if (!file) {
      return Result<void>::error("Failed to write " + tempPath);
    }
  }

  fs::rename(tempPath, userConfigPath, ec);
  if (ec) {
    return Result<void>::error("Failed to save config: " + ec.message());
  }

  BRANCHLINE_LOG_INFO("User configuration saved to {}", userConfigPath);
  return Result<void>::ok();
}

void ConfigManager::resetToDefaults() {
  m_config = EngineConfig();
  notifyConfigChanged();
}

void ConfigManager::resetUserSettings() {
  m_config = m_baseConfig;
  notifyConfigChanged();
}

void ConfigManager::setOnConfigChanged(ConfigChangeCallback callback) {
  m_onConfigChanged = std::move(callback);
}

void ConfigManager::notifyConfigChanged() {
  if (m_onConfigChanged) {
    m_onConfigChanged(m_config);
  }
}

std::string ConfigManager::getConfigPath() const {
  return m_basePath + "config/";
}

std::string ConfigManager::getScriptsPath() const {
  const fs::path scripts(m_config.scripts.directory);
  if (scripts.is_absolute()) {
    return scripts.string();
  }
  return m_basePath + m_config.scripts.directory;
}

void ConfigManager::setLogLevel(const std::string& level) {
  if (!core::parseLogLevel(level)) {
    BRANCHLINE_LOG_WARN("Ignoring unknown log level '{}'", level);
    return;
  }
  m_config.logging.logLevel = level;
  notifyConfigChanged();
}

void ConfigManager::setRepromptMessage(const std::string& message) {
  m_config.session.repromptMessage = message;
  notifyConfigChanged();
}

void ConfigManager::setFallbackMessage(const std::string& message) {
  m_config.fallback.message = message;
  notifyConfigChanged();
}

void ConfigManager::setMaxChainedTransitions(i32 limit) {
  m_config.session.maxChainedTransitions = std::clamp(limit, 1, 100000);
  notifyConfigChanged();
}

Result<void> ConfigManager::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<void>::error("Cannot open file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto result = parseJson(buffer.str(), m_config);
  if (result.isError()) {
    return Result<void>::error(path + ": " + result.error());
  }
  BRANCHLINE_LOG_DEBUG("Applied configuration from {}", path);
  return result;
}

Result<void> ConfigManager::parseJson(const std::string& jsonStr, EngineConfig& config) const {
  const std::string content = json::trim(jsonStr);
  if (content.empty() || content.front() != '{' || content.back() != '}') {
    return Result<void>::error("Configuration is not a JSON object");
  }

  // Parse into a copy so a bad file leaves the configuration untouched
  EngineConfig parsed = config;

  if (auto version = json::extractString(content, "version")) {
    parsed.version = *version;
  }

  std::string scriptsObj = json::extractObject(content, "scripts");
  if (!scriptsObj.empty()) {
    if (auto dir = json::extractString(scriptsObj, "directory"); dir && !dir->empty())
      parsed.scripts.directory = *dir;
    if (auto entry = json::extractString(scriptsObj, "entry_file"); entry && !entry->empty())
      parsed.scripts.entryFile = *entry;
    if (auto start = json::extractString(scriptsObj, "start_node"); start && !start->empty())
      parsed.scripts.startNode = *start;
  }

  std::string fallbackObj = json::extractObject(content, "fallback");
  if (!fallbackObj.empty()) {
    if (auto message = json::extractString(fallbackObj, "message"))
      parsed.fallback.message = *message;
    if (auto destination = json::extractString(fallbackObj, "destination"))
      parsed.fallback.destination = *destination;
  }

  std::string sessionObj = json::extractObject(content, "session");
  if (!sessionObj.empty()) {
    if (auto reprompt = json::extractString(sessionObj, "reprompt_message"))
      parsed.session.repromptMessage = *reprompt;
    if (auto limit = json::extractInt(sessionObj, "max_chained_transitions")) {
      if (*limit <= 0 || *limit > 100000) {
        return Result<void>::error("session.max_chained_transitions must be between 1 and 100000");
      }
      parsed.session.maxChainedTransitions = static_cast<i32>(*limit);
    }
  }

  std::string loggingObj = json::extractObject(content, "logging");
  if (!loggingObj.empty()) {
    if (auto level = json::extractString(loggingObj, "log_level")) {
      if (!core::parseLogLevel(*level)) {
        return Result<void>::error("Unknown log level '" + *level + "'");
      }
      parsed.logging.logLevel = *level;
    }
    if (auto toFile = json::extractBool(loggingObj, "log_to_file"))
      parsed.logging.logToFile = *toFile;
    if (auto logFile = json::extractString(loggingObj, "log_file"); logFile && !logFile->empty())
      parsed.logging.logFile = *logFile;
  }

  config = std::move(parsed);
  return Result<void>::ok();
}

std::string ConfigManager::serializeToJson(bool userSettingsOnly) const {
  const EngineConfig& config = m_config;
  std::ostringstream out;
  out << "{\n";
  out << "  \"version\": \"" << json::escape(config.version) << "\",\n";

  if (!userSettingsOnly) {
    out << "  \"scripts\": {\n";
    out << "    \"directory\": \"" << json::escape(config.scripts.directory) << "\",\n";
    out << "    \"entry_file\": \"" << json::escape(config.scripts.entryFile) << "\",\n";
    out << "    \"start_node\": \"" << json::escape(config.scripts.startNode) << "\"\n";
    out << "  },\n";
    out << "  \"fallback\": {\n";
    out << "    \"message\": \"" << json::escape(config.fallback.message) << "\",\n";
    out << "    \"destination\": \"" << json::escape(config.fallback.destination) << "\"\n";
    out << "  },\n";
  }

  out << "  \"session\": {\n";
  out << "    \"reprompt_message\": \"" << json::escape(config.session.repromptMessage) << "\",\n";
  out << "    \"max_chained_transitions\": " << config.session.maxChainedTransitions << "\n";
  out << "  },\n";

  out << "  \"logging\": {\n";
  out << "    \"log_level\": \"" << json::escape(config.logging.logLevel) << "\",\n";
  out << "    \"log_to_file\": " << (config.logging.logToFile ? "true" : "false") << ",\n";
  out << "    \"log_file\": \"" << json::escape(config.logging.logFile) << "\"\n";
  out << "  }\n";

  out << "}\n";
  return out.str();
}

} // namespace Branchline::runtime
