/**
 * @file dialogue_launcher_main.cpp
 * @brief Branchline console launcher entry point
 *
 * Usage:
 *   branchline_launcher                         # config/engine_config.json in the working dir
 *   branchline_launcher --scripts samples/security_training
 *   branchline_launcher --validate              # check the scripts and exit
 *   branchline_launcher --help
 */

#include "Branchline/runtime/dialogue_launcher.hpp"
#include <iostream>

namespace {

int runDialogueLauncher(int argc, char* argv[]) {
  Branchline::runtime::DialogueLauncher launcher;

  launcher.setOnError([](const Branchline::runtime::LauncherError& error) {
    if (!error.suggestion.empty()) {
      std::cerr << "How to fix:\n  " << error.suggestion << "\n\n";
    }
  });

  auto result = launcher.initialize(argc, argv);
  if (result.isError()) {
    launcher.showError(result.error());
    return 1;
  }

  return launcher.run();
}

} // namespace

int main(int argc, char* argv[]) {
  return runDialogueLauncher(argc, argv);
}
