/**
 * @file dialogue_launcher.cpp
 * @brief Console launcher implementation
 */

#include "Branchline/runtime/dialogue_launcher.hpp"
#include "Branchline/core/logger.hpp"
#include "Branchline/scripting/script_source.hpp"
#include <cctype>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace Branchline::runtime {

using scripting::FunctionResult;
using scripting::SessionState;
using scripting::Value;

std::string LauncherError::format() const {
  std::string result = "[" + code + "] " + message;
  if (!details.empty()) {
    result += "\nDetails: " + details;
  }
  if (!suggestion.empty()) {
    result += "\nSuggestion: " + suggestion;
  }
  return result;
}

DialogueLauncher::DialogueLauncher() = default;

DialogueLauncher::~DialogueLauncher() {
  if (m_state == LauncherState::Running) {
    quit();
  }
}

Result<void> DialogueLauncher::initialize(int argc, char* argv[]) {
  m_options = parseArgs(argc, argv);

  if (m_options.help) {
    printHelp(argc > 0 ? argv[0] : "branchline_launcher");
    m_state = LauncherState::Ready;
    return Result<void>::ok();
  }

  if (m_options.version) {
    printVersion();
    m_state = LauncherState::Ready;
    return Result<void>::ok();
  }

  if (!m_options.unknownArgument.empty()) {
    setError("ARGS", "Unknown argument: " + m_options.unknownArgument, "",
             "Run with --help to list the supported options");
    return Result<void>::error(m_lastError.message);
  }

  std::error_code ec;
  const fs::path cwd = fs::current_path(ec);
  return initialize(ec ? std::string(".") : cwd.string(), m_options);
}

Result<void> DialogueLauncher::initialize(const std::string& basePath,
                                          const LaunchOptions& options) {
  setState(LauncherState::Initializing);
  m_basePath = basePath;
  m_options = options;

  if (!m_basePath.empty() && m_basePath.back() != '/' && m_basePath.back() != '\\') {
    m_basePath += '/';
  }

  initializeLogging();

  auto result = initializeConfig();
  if (result.isError()) {
    setError("INIT_CONFIG", "Failed to load configuration", result.error(),
             "Check that config/engine_config.json is valid JSON");
    return result;
  }

  result = initializeLogFile();
  if (result.isError()) {
    setError("INIT_LOG", "Failed to open the log file", result.error(),
             "Check write permissions for the log file");
    return result;
  }

  initializeFunctions();

  result = initializeScripts();
  if (result.isError()) {
    setError("INIT_SCRIPTS", "Failed to load scripts", result.error(),
             "Check the script directory and the entry file named in the configuration");
    return result;
  }

  runValidation();

  setState(LauncherState::Ready);
  BRANCHLINE_LOG_INFO("Launcher ready");
  return Result<void>::ok();
}

i32 DialogueLauncher::run() {
  return run(std::cin, std::cout);
}

i32 DialogueLauncher::run(std::istream& in, std::ostream& out) {
  if (m_options.help || m_options.version) {
    return 0;
  }
  if (m_state != LauncherState::Ready) {
    BRANCHLINE_LOG_ERROR("Cannot run: launcher is not ready");
    return 1;
  }

  if (m_options.validateOnly) {
    for (const auto& diagnostic : m_validation.errors.all()) {
      out << diagnostic.format() << "\n";
    }
    out << m_validation.documentsChecked << " file(s) checked, "
        << m_validation.errors.errorCount() << " error(s), "
        << m_validation.errors.warningCount() << " warning(s)\n";
    return m_validation.isValid ? 0 : 1;
  }

  setState(LauncherState::Running);

  const EngineConfig& config = getConfig();
  scripting::Navigator navigator(*m_registry, *m_dispatcher, config.toNavigatorOptions());

  i32 exitCode = 0;
  auto output = navigator.start(config.scripts.entryFile);
  printOutput(output, out);
  if (output.hasSegment(scripting::OutputSegment::Kind::Error)) {
    exitCode = 1;
  }

  std::string line;
  while (m_state == LauncherState::Running && !navigator.isExited()) {
    out << "> " << std::flush;
    if (!std::getline(in, line)) {
      BRANCHLINE_LOG_INFO("Input closed; ending session");
      break;
    }
    output = navigator.submitInput(line);
    printOutput(output, out);
    if (output.hasSegment(scripting::OutputSegment::Kind::Error)) {
      exitCode = 1;
    }
  }

  BRANCHLINE_LOG_INFO("Session ended at {}:{} ({})", navigator.currentFile(),
                      navigator.currentNode(), scripting::sessionStatusName(navigator.status()));
  setState(LauncherState::Ready);
  return exitCode;
}

void DialogueLauncher::quit() {
  if (m_state == LauncherState::Running) {
    setState(LauncherState::ShuttingDown);
  }
}

void DialogueLauncher::showError(const LauncherError& error) {
  m_lastError = error;
  BRANCHLINE_LOG_ERROR("{}", error.format());

  std::cerr << "\n=== Error ===\n";
  std::cerr << error.format() << "\n";
  std::cerr << "=============\n\n";

  if (m_onError) {
    m_onError(error);
  }
}

void DialogueLauncher::showError(const std::string& error) {
  // A failed initialize() has already recorded a structured error
  if (m_state == LauncherState::Error && !m_lastError.code.empty()) {
    showError(m_lastError);
    return;
  }
  LauncherError err;
  err.code = "ERROR";
  err.message = error;
  showError(err);
}

const EngineConfig& DialogueLauncher::getConfig() const {
  static const EngineConfig defaults;
  return m_configManager ? m_configManager->getConfig() : defaults;
}

void DialogueLauncher::printVersion() {
  std::cout << "Branchline launcher version " << BRANCHLINE_VERSION_MAJOR << "."
            << BRANCHLINE_VERSION_MINOR << "." << BRANCHLINE_VERSION_PATCH << "\n";
  std::cout << "Branching dialogue engine for BDL scripts\n";
}

void DialogueLauncher::printHelp(const char* programName) {
  std::cout << "Usage: " << programName << " [options]\n\n";
  std::cout << "Runs an interactive BDL dialogue session on the console.\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config <path>    Apply an extra configuration file\n";
  std::cout << "  --scripts <dir>    Script directory\n";
  std::cout << "  --entry <file>     Entry script (default main.bdl)\n";
  std::cout << "  --start <node>     Start node (default start)\n";
  std::cout << "  --validate         Check the scripts and exit\n";
  std::cout << "  -v, --verbose      Debug logging\n";
  std::cout << "  -h, --help         Show this help message\n";
  std::cout << "  --version          Show version information\n\n";
  std::cout << "Configuration is read from:\n";
  std::cout << "  config/engine_config.json - engine settings\n";
  std::cout << "  config/engine_user.json   - user overrides\n";
}

LaunchOptions DialogueLauncher::parseArgs(int argc, char* argv[]) {
  LaunchOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--config" && i + 1 < argc) {
      opts.configOverride = argv[++i];
    } else if (arg == "--scripts" && i + 1 < argc) {
      opts.scriptsOverride = argv[++i];
    } else if (arg == "--entry" && i + 1 < argc) {
      opts.entryOverride = argv[++i];
    } else if (arg == "--start" && i + 1 < argc) {
      opts.startOverride = argv[++i];
    } else if (arg == "--validate") {
      opts.validateOnly = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (opts.unknownArgument.empty()) {
      opts.unknownArgument = arg;
    }
  }

  return opts;
}

void DialogueLauncher::registerDefaultFunctions(scripting::FunctionDispatcher& dispatcher) {
  dispatcher.registerFunction("getUserInput", [](SessionState& state) {
    return FunctionResult::ok({Value(state.lastInput())});
  });

  dispatcher.registerFunction("setUserName", [](SessionState& state) {
    const std::string name = state.lastInput();
    if (name.empty()) {
      return FunctionResult::failure("No name has been entered");
    }
    auto saved = state.setGlobal("user_name", Value(name));
    return FunctionResult::ok({Value(name), Value(saved.isOk())});
  });

  dispatcher.registerFunction("analyzePassword", [](SessionState& state) {
    const std::string& password = state.lastInput();
    if (password.empty()) {
      return FunctionResult::failure("No password to analyze");
    }

    bool lower = false;
    bool upper = false;
    bool digit = false;
    bool symbol = false;
    for (char c : password) {
      const auto uc = static_cast<unsigned char>(c);
      if (std::islower(uc)) {
        lower = true;
      } else if (std::isupper(uc)) {
        upper = true;
      } else if (std::isdigit(uc)) {
        digit = true;
      } else if (!std::isspace(uc)) {
        symbol = true;
      }
    }
    const int classes = int(lower) + int(upper) + int(digit) + int(symbol);

    std::string rating;
    if (password.size() >= 12 && classes >= 3) {
      rating = "strong";
    } else if (password.size() >= 8 && classes >= 2) {
      rating = "moderate";
    } else {
      rating = "weak";
    }
    return FunctionResult::ok({Value("That password looks " + rating + " (" +
                                     std::to_string(password.size()) + " characters, " +
                                     std::to_string(classes) + " character classes)."),
                               Value("password_quiz")});
  });
}

void DialogueLauncher::printOutput(const scripting::Output& output, std::ostream& out) {
  using Kind = scripting::OutputSegment::Kind;
  for (const auto& segment : output.segments) {
    if (segment.kind == Kind::Error) {
      out << "error: " << segment.text << "\n";
    } else {
      out << segment.text << "\n";
    }
  }
  if (output.exited) {
    out << "[session ended]\n";
  }
}

void DialogueLauncher::initializeLogging() {
  auto& logger = core::Logger::instance();
  logger.setLevel(m_options.verbose ? core::LogLevel::Debug : core::LogLevel::Warning);
}

Result<void> DialogueLauncher::initializeConfig() {
  m_configManager = std::make_unique<ConfigManager>();

  auto result = m_configManager->initialize(m_basePath);
  if (result.isError()) {
    return result;
  }

  result = m_configManager->loadConfig();
  if (result.isError()) {
    return result;
  }

  if (!m_options.configOverride.empty()) {
    result = m_configManager->loadConfigFile(m_options.configOverride);
    if (result.isError()) {
      return result;
    }
  }

  EngineConfig& config = m_configManager->getConfigMutable();
  if (!m_options.scriptsOverride.empty()) {
    config.scripts.directory = m_options.scriptsOverride;
  }
  if (!m_options.entryOverride.empty()) {
    config.scripts.entryFile = m_options.entryOverride;
  }
  if (!m_options.startOverride.empty()) {
    config.scripts.startNode = m_options.startOverride;
  }

  if (!m_options.verbose) {
    if (auto level = core::parseLogLevel(config.logging.logLevel)) {
      core::Logger::instance().setLevel(*level);
    }
  }

  return Result<void>::ok();
}

Result<void> DialogueLauncher::initializeLogFile() {
  const EngineConfig& config = getConfig();
  if (config.logging.logToFile) {
    fs::path logFile(config.logging.logFile);
    if (logFile.is_relative()) {
      logFile = fs::path(m_basePath) / logFile;
    }
    std::error_code ec;
    fs::create_directories(logFile.parent_path(), ec);
    if (ec) {
      return Result<void>::error("Cannot create log directory " +
                                 logFile.parent_path().string() + ": " + ec.message());
    }
    if (!core::Logger::instance().setOutputFile(logFile.string())) {
      return Result<void>::error("Cannot open log file " + logFile.string());
    }
    BRANCHLINE_LOG_INFO("Logging to {}", logFile.string());
  }

  return Result<void>::ok();
}

void DialogueLauncher::initializeFunctions() {
  m_dispatcher = std::make_unique<scripting::FunctionDispatcher>();
  registerDefaultFunctions(*m_dispatcher);
  BRANCHLINE_LOG_DEBUG("{} host function(s) registered", m_dispatcher->functionNames().size());
}

Result<void> DialogueLauncher::initializeScripts() {
  const std::string scriptsPath = m_configManager->getScriptsPath();
  std::error_code ec;
  if (!fs::is_directory(scriptsPath, ec)) {
    return Result<void>::error("Script directory not found: " + scriptsPath);
  }

  auto source = std::make_shared<scripting::FileScriptSource>(scriptsPath);
  m_registry = std::make_unique<scripting::DocumentRegistry>(std::move(source));

  const std::string& entryFile = getConfig().scripts.entryFile;
  auto entry = m_registry->loadEntry(entryFile);
  if (entry.isError()) {
    return Result<void>::error(entry.error().formatRich());
  }

  for (const auto& warning : m_registry->diagnostics().all()) {
    BRANCHLINE_LOG_WARN("{}", warning.format());
  }
  BRANCHLINE_LOG_INFO("Loaded {} script(s) from {}", m_registry->loadedDocuments().size(),
                      scriptsPath);
  return Result<void>::ok();
}

void DialogueLauncher::runValidation() {
  scripting::Validator validator;
  validator.setFunctionDispatcher(m_dispatcher.get());
  validator.setStartNode(getConfig().scripts.startNode);
  m_validation = validator.validate(*m_registry);

  for (const auto& diagnostic : m_validation.errors.all()) {
    if (diagnostic.isError()) {
      BRANCHLINE_LOG_ERROR("{}", diagnostic.format());
    } else if (diagnostic.isWarning()) {
      BRANCHLINE_LOG_WARN("{}", diagnostic.format());
    } else {
      BRANCHLINE_LOG_DEBUG("{}", diagnostic.format());
    }
  }
}

void DialogueLauncher::setState(LauncherState state) {
  m_state = state;
}

void DialogueLauncher::setError(const std::string& code, const std::string& message,
                                const std::string& details, const std::string& suggestion) {
  m_lastError.code = code;
  m_lastError.message = message;
  m_lastError.details = details;
  m_lastError.suggestion = suggestion;
  setState(LauncherState::Error);
}

} // namespace Branchline::runtime
