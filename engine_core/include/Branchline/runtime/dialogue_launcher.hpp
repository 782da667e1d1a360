#pragma once

/**
 * @file dialogue_launcher.hpp
 * @brief Console host for BDL sessions
 *
 * The launcher wires the engine together for an interactive console session:
 *
 * 1. Parse command-line arguments (developer overrides)
 * 2. Initialize logging
 * 3. Load config/engine_config.json and config/engine_user.json
 * 4. Open the script directory and load the entry file with its requirements
 * 5. Register the built-in host functions
 * 6. Validate the loaded scripts
 * 7. Run a session, feeding it one line of standard input at a time
 *
 * Example usage:
 * @code
 * int main(int argc, char* argv[]) {
 *     Branchline::runtime::DialogueLauncher launcher;
 *
 *     auto result = launcher.initialize(argc, argv);
 *     if (result.isError()) {
 *         launcher.showError(result.error());
 *         return 1;
 *     }
 *
 *     return launcher.run();
 * }
 * @endcode
 */

#include "Branchline/core/result.hpp"
#include "Branchline/core/types.hpp"
#include "Branchline/runtime/config_manager.hpp"
#include "Branchline/runtime/runtime_config.hpp"
#include "Branchline/scripting/document_registry.hpp"
#include "Branchline/scripting/function_dispatcher.hpp"
#include "Branchline/scripting/navigator.hpp"
#include "Branchline/scripting/validator.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace Branchline::runtime {

enum class LauncherState { Uninitialized, Initializing, Ready, Running, Error, ShuttingDown };

struct LauncherError {
  std::string code;
  std::string message;
  std::string details;
  std::string suggestion;

  [[nodiscard]] std::string format() const;
};

/**
 * @brief Command-line options
 */
struct LaunchOptions {
  std::string configOverride;  // Extra config file applied after the defaults
  std::string scriptsOverride; // Script directory
  std::string entryOverride;   // Entry file
  std::string startOverride;   // Start node
  bool verbose = false;        // Debug logging
  bool validateOnly = false;   // Validate scripts and exit
  bool help = false;
  bool version = false;
  std::string unknownArgument; // First argument that was not understood
};

using OnLauncherError = std::function<void(const LauncherError&)>;

class DialogueLauncher {
public:
  DialogueLauncher();
  ~DialogueLauncher();

  DialogueLauncher(const DialogueLauncher&) = delete;
  DialogueLauncher& operator=(const DialogueLauncher&) = delete;

  /**
   * @brief Initialize from main() arguments; the base path is the working directory
   */
  Result<void> initialize(int argc, char* argv[]);

  /**
   * @brief Initialize with explicit options (for embedding and tests)
   */
  Result<void> initialize(const std::string& basePath, const LaunchOptions& options = {});

  /**
   * @brief Run a session on standard input/output
   * @return Exit code (0 = success)
   */
  i32 run();

  /**
   * @brief Run a session on the given streams
   */
  i32 run(std::istream& in, std::ostream& out);

  void quit();
  [[nodiscard]] bool isRunning() const { return m_state == LauncherState::Running; }
  [[nodiscard]] LauncherState getState() const { return m_state; }

  void showError(const LauncherError& error);
  void showError(const std::string& error);
  [[nodiscard]] const LauncherError& getLastError() const { return m_lastError; }

  [[nodiscard]] ConfigManager* getConfigManager() { return m_configManager.get(); }
  [[nodiscard]] scripting::DocumentRegistry* getRegistry() { return m_registry.get(); }
  [[nodiscard]] scripting::FunctionDispatcher* getDispatcher() { return m_dispatcher.get(); }
  [[nodiscard]] const EngineConfig& getConfig() const;
  [[nodiscard]] const scripting::ValidationResult& getValidationResult() const {
    return m_validation;
  }

  void setOnError(OnLauncherError callback) { m_onError = std::move(callback); }

  static void printVersion();
  static void printHelp(const char* programName);
  [[nodiscard]] static LaunchOptions parseArgs(int argc, char* argv[]);

  /**
   * @brief Register getUserInput, setUserName and analyzePassword
   *
   * - getUserInput returns the last input line that matched an option
   * - setUserName stores that line in the global user_name and returns
   *   (name, saved)
   * - analyzePassword rates that line and returns (message, next node)
   */
  static void registerDefaultFunctions(scripting::FunctionDispatcher& dispatcher);

  /**
   * @brief Write one step of session output the way the console shows it
   */
  static void printOutput(const scripting::Output& output, std::ostream& out);

private:
  void initializeLogging();
  Result<void> initializeConfig();
  Result<void> initializeLogFile();
  Result<void> initializeScripts();
  void initializeFunctions();
  void runValidation();

  void setState(LauncherState state);
  void setError(const std::string& code, const std::string& message,
                const std::string& details = "", const std::string& suggestion = "");

  LauncherState m_state = LauncherState::Uninitialized;
  LaunchOptions m_options;
  std::string m_basePath;

  std::unique_ptr<ConfigManager> m_configManager;
  std::unique_ptr<scripting::DocumentRegistry> m_registry;
  std::unique_ptr<scripting::FunctionDispatcher> m_dispatcher;
  scripting::ValidationResult m_validation;

  LauncherError m_lastError;
  OnLauncherError m_onError;
};

} // namespace Branchline::runtime
