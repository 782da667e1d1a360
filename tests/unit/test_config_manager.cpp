#include <catch2/catch_test_macros.hpp>
#include "Branchline/runtime/config_manager.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace Branchline::runtime;
using Branchline::test::TestDirectory;

TEST_CASE("ConfigManager defaults", "[config]") {
  TestDirectory dir("config_defaults");
  ConfigManager manager;
  REQUIRE(manager.loadConfig().isError()); // not initialized yet

  REQUIRE(manager.initialize(dir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());

  const EngineConfig& config = manager.getConfig();
  REQUIRE(config.scripts.directory == "scripts");
  REQUIRE(config.scripts.entryFile == "main.bdl");
  REQUIRE(config.scripts.startNode == "start");
  REQUIRE(config.fallback.message == "Sorry, something went wrong. Let's start over.");
  REQUIRE(config.fallback.destination.empty());
  REQUIRE(config.session.maxChainedTransitions == 64);
  REQUIRE(config.logging.logLevel == "info");
  REQUIRE_FALSE(config.logging.logToFile);

  REQUIRE(manager.getConfigPath() == dir.path() + "/config/");
  REQUIRE(manager.getScriptsPath() == dir.path() + "/scripts");
}

TEST_CASE("ConfigManager reads engine_config.json", "[config]") {
  TestDirectory dir("config_engine");
  dir.writeFile("config/engine_config.json", R"({
  "version": "1.0",
  "scripts": {
    "directory": "samples/security_training",
    "entry_file": "training.bdl",
    "start_node": "welcome"
  },
  "fallback": {
    "message": "Something broke, \"sorry\".",
    "destination": "training.bdl:welcome"
  },
  "session": {
    "reprompt_message": "Pick one of the options.",
    "max_chained_transitions": 16
  },
  "logging": {
    "log_level": "debug",
    "log_to_file": true,
    "log_file": "logs/test.log"
  }
})");

  ConfigManager manager;
  REQUIRE(manager.initialize(dir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());

  const EngineConfig& config = manager.getConfig();
  REQUIRE(config.scripts.directory == "samples/security_training");
  REQUIRE(config.scripts.entryFile == "training.bdl");
  REQUIRE(config.scripts.startNode == "welcome");
  REQUIRE(config.fallback.message == "Something broke, \"sorry\".");
  REQUIRE(config.fallback.destination == "training.bdl:welcome");
  REQUIRE(config.session.repromptMessage == "Pick one of the options.");
  REQUIRE(config.session.maxChainedTransitions == 16);
  REQUIRE(config.logging.logLevel == "debug");
  REQUIRE(config.logging.logToFile);
  REQUIRE(config.logging.logFile == "logs/test.log");

  SECTION("navigator options follow the configuration") {
    const auto options = config.toNavigatorOptions();
    REQUIRE(options.startNode == "welcome");
    REQUIRE(options.fallback.startNode == "welcome");
    REQUIRE(options.fallback.destination == "training.bdl:welcome");
    REQUIRE(options.repromptMessage == "Pick one of the options.");
    REQUIRE(options.maxChainedTransitions == 16);
  }
}

TEST_CASE("ConfigManager layers user overrides", "[config]") {
  TestDirectory dir("config_user");
  dir.writeFile("config/engine_config.json",
                R"({ "session": { "reprompt_message": "Base prompt", "max_chained_transitions": 32 } })");
  dir.writeFile("config/engine_user.json", R"({ "session": { "reprompt_message": "User prompt" } })");

  ConfigManager manager;
  REQUIRE(manager.initialize(dir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());
  REQUIRE(manager.getConfig().session.repromptMessage == "User prompt");
  REQUIRE(manager.getConfig().session.maxChainedTransitions == 32);

  SECTION("resetting user settings restores the base file") {
    manager.resetUserSettings();
    REQUIRE(manager.getConfig().session.repromptMessage == "Base prompt");
  }

  SECTION("resetting to defaults drops both files") {
    manager.resetToDefaults();
    REQUIRE(manager.getConfig().session.maxChainedTransitions == 64);
  }
}

TEST_CASE("ConfigManager rejects malformed configuration", "[config][errors]") {
  TestDirectory dir("config_bad");
  ConfigManager manager;
  REQUIRE(manager.initialize(dir.path()).isOk());

  SECTION("not an object") {
    REQUIRE(manager.applyJson("[1, 2, 3]").isError());
    REQUIRE(manager.applyJson("").isError());
  }

  SECTION("unknown log level leaves the configuration untouched") {
    auto result = manager.applyJson(
        R"({ "session": { "reprompt_message": "changed" }, "logging": { "log_level": "chatty" } })");
    REQUIRE(result.isError());
    REQUIRE(result.error().find("chatty") != std::string::npos);
    REQUIRE(manager.getConfig().session.repromptMessage ==
            "I didn't understand that. Please choose one of the options.");
  }

  SECTION("transition limit out of range") {
    REQUIRE(manager.applyJson(R"({ "session": { "max_chained_transitions": 0 } })").isError());
    REQUIRE(manager.applyJson(R"({ "session": { "max_chained_transitions": 1000000 } })").isError());
    REQUIRE(manager.getConfig().session.maxChainedTransitions == 64);
  }

  SECTION("a malformed engine_config.json fails loading") {
    dir.writeFile("config/engine_config.json", "scripts = main.bdl");
    auto result = manager.loadConfig();
    REQUIRE(result.isError());
    REQUIRE(result.error().find("engine_config.json") != std::string::npos);
  }

  SECTION("a missing explicit file fails") {
    REQUIRE(manager.loadConfigFile(dir.path() + "/nope.json").isError());
  }
}

TEST_CASE("ConfigManager setters", "[config]") {
  TestDirectory dir("config_setters");
  ConfigManager manager;
  REQUIRE(manager.initialize(dir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());

  int notifications = 0;
  manager.setOnConfigChanged([&notifications](const EngineConfig&) { ++notifications; });

  SECTION("log level") {
    manager.setLogLevel("error");
    REQUIRE(manager.getConfig().logging.logLevel == "error");
    manager.setLogLevel("loud");
    REQUIRE(manager.getConfig().logging.logLevel == "error");
    REQUIRE(notifications == 1);
  }

  SECTION("transition limit is clamped") {
    manager.setMaxChainedTransitions(0);
    REQUIRE(manager.getConfig().session.maxChainedTransitions == 1);
    manager.setMaxChainedTransitions(500);
    REQUIRE(manager.getConfig().session.maxChainedTransitions == 500);
    REQUIRE(notifications == 2);
  }

  SECTION("messages") {
    manager.setRepromptMessage("Again?");
    manager.setFallbackMessage("Oops.");
    REQUIRE(manager.getConfig().session.repromptMessage == "Again?");
    REQUIRE(manager.getConfig().fallback.message == "Oops.");
  }
}

TEST_CASE("ConfigManager saves user settings", "[config]") {
  TestDirectory dir("config_save");
  dir.writeFile("config/engine_config.json", R"({ "scripts": { "entry_file": "training.bdl" } })");

  {
    ConfigManager manager;
    REQUIRE(manager.initialize(dir.path()).isOk());
    REQUIRE(manager.loadConfig().isOk());
    manager.setRepromptMessage("Say \"again\"\nplease");
    manager.setMaxChainedTransitions(10);
    REQUIRE(manager.saveUserConfig().isOk());
  }

  REQUIRE(std::filesystem::exists(dir.fsPath() / "config" / "engine_user.json"));
  REQUIRE_FALSE(std::filesystem::exists(dir.fsPath() / "config" / "engine_user.json.tmp"));

  ConfigManager reloaded;
  REQUIRE(reloaded.initialize(dir.path()).isOk());
  REQUIRE(reloaded.loadConfig().isOk());
  REQUIRE(reloaded.getConfig().session.repromptMessage == "Say \"again\"\nplease");
  REQUIRE(reloaded.getConfig().session.maxChainedTransitions == 10);
  REQUIRE(reloaded.getConfig().scripts.entryFile == "training.bdl");

  SECTION("user settings only hold session and logging") {
    const std::string json = reloaded.serializeToJson(true);
    REQUIRE(json.find("\"scripts\"") == std::string::npos);
    REQUIRE(json.find("\"session\"") != std::string::npos);
    REQUIRE(json.find("\"logging\"") != std::string::npos);
  }
}
