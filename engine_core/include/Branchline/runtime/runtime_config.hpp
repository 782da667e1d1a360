#pragma once

/**
 * @file runtime_config.hpp
 * @brief Engine configuration read from config/engine_config.json
 *
 * Sections:
 * - scripts:  where scripts live, which file is the entry, where to start
 * - fallback: what a session says and where it goes after a recovered error
 * - session:  re-prompt text and the automatic transition limit
 * - logging:  level and optional log file
 */

#include "Branchline/core/types.hpp"
#include "Branchline/scripting/navigator.hpp"
#include <string>

namespace Branchline::runtime {

struct ScriptSettings {
  std::string directory = "scripts";
  std::string entryFile = "main.bdl";
  std::string startNode = "start";
};

struct FallbackSettings {
  std::string message = "Sorry, something went wrong. Let's start over.";
  std::string destination; // "file:node"; empty means "<entryFile>:<startNode>"
};

struct SessionSettings {
  std::string repromptMessage = "I didn't understand that. Please choose one of the options.";
  i32 maxChainedTransitions = 64;
};

struct LoggingSettings {
  std::string logLevel = "info";
  bool logToFile = false;
  std::string logFile = "logs/branchline.log";
};

struct EngineConfig {
  std::string version = "1.0";

  ScriptSettings scripts;
  FallbackSettings fallback;
  SessionSettings session;
  LoggingSettings logging;

  /// Options for a Navigator running with this configuration
  [[nodiscard]] scripting::NavigatorOptions toNavigatorOptions() const {
    scripting::NavigatorOptions options;
    options.startNode = scripts.startNode;
    options.fallback.message = fallback.message;
    options.fallback.destination = fallback.destination;
    options.fallback.startNode = scripts.startNode;
    options.repromptMessage = session.repromptMessage;
    options.maxChainedTransitions =
        session.maxChainedTransitions > 0 ? static_cast<u32>(session.maxChainedTransitions) : 1u;
    return options;
  }
};

} // namespace Branchline::runtime
