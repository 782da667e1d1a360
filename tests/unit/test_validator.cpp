#include <catch2/catch_test_macros.hpp>
#include "Branchline/scripting/validator.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <utility>

using namespace Branchline::scripting;
using Branchline::test::header;
using Branchline::test::memorySource;

namespace {

ValidationResult
validateScripts(std::initializer_list<std::pair<std::string, std::string>> scripts,
                const FunctionDispatcher* dispatcher = nullptr) {
  auto source = memorySource();
  for (const auto& [name, text] : scripts) {
    source->add(name, text);
  }
  DocumentRegistry registry(source);
  auto entry = registry.loadEntry("main.bdl");
  REQUIRE(entry.isOk());

  Validator validator;
  validator.setFunctionDispatcher(dispatcher);
  return validator.validate(registry);
}

usize countCode(const ValidationResult& result, ErrorCode code) {
  const auto& all = result.errors.all();
  return static_cast<usize>(std::count_if(
      all.begin(), all.end(), [code](const ScriptError& e) { return e.code == code; }));
}

const ScriptError* findCode(const ValidationResult& result, ErrorCode code) {
  for (const auto& e : result.errors.all()) {
    if (e.code == code) {
      return &e;
    }
  }
  return nullptr;
}

} // namespace

TEST_CASE("Validator accepts a consistent script set", "[validator]") {
  FunctionDispatcher dispatcher;
  dispatcher.registerFunction("getUserInput", [](SessionState&) { return FunctionResult::ok(); });

  auto result = validateScripts(
      {{"main.bdl", header("Main", "b.bdl") + "@start\n"
                                              "!{getUserInput} : ~{input}\n"
                                              "{go} -> intro\n"
                                              "@intro\n"
                                              "{module} -> [b.bdl:start]\n"
                                              "{bye} -> {exit}\n"},
       {"b.bdl", header("B", "main.bdl") + "@start\n-> [main.bdl:intro]\n"}},
      &dispatcher);

  REQUIRE(result.isValid);
  REQUIRE(result.errors.empty());
  REQUIRE(result.documentsChecked == 2);
  REQUIRE(result.dynamicDestinations == 0);
}

TEST_CASE("Validator reports broken references", "[validator][errors]") {
  SECTION("unknown node in the same file") {
    auto result = validateScripts({{"main.bdl", header("Main") + "@start\n{a} -> intr\n@intro\n"
                                                                 "{b} -> start\n"}});
    REQUIRE_FALSE(result.isValid);
    const ScriptError* error = findCode(result, ErrorCode::UnknownNode);
    REQUIRE(error != nullptr);
    REQUIRE(error->isError());
    REQUIRE(error->span.start.line == 7);
    REQUIRE(error->suggestions.size() == 1);
    REQUIRE(error->suggestions[0] == "Did you mean 'intro'?");
  }

  SECTION("unknown node in another file") {
    auto result = validateScripts(
        {{"main.bdl", header("Main", "b.bdl") + "@start\n{b} -> [b.bdl:strat]\n"},
         {"b.bdl", header("B") + "@start\n{x} -> start\n"}});
    REQUIRE_FALSE(result.isValid);
    const ScriptError* error = findCode(result, ErrorCode::UnknownNode);
    REQUIRE(error != nullptr);
    REQUIRE(error->filePath == std::optional<std::string>("main.bdl"));
    REQUIRE(error->suggestions[0] == "Did you mean 'start'?");
  }

  SECTION("transfer to a file that does not exist") {
    auto result =
        validateScripts({{"main.bdl", header("Main") + "@start\n{d} -> [ghost.bdl:start]\n"}});
    REQUIRE_FALSE(result.isValid);
    REQUIRE(countCode(result, ErrorCode::UnknownFile) == 1);
    REQUIRE(countCode(result, ErrorCode::UndeclaredDependency) == 1);
  }

  SECTION("transfer to an existing but undeclared file") {
    auto result = validateScripts({{"main.bdl", header("Main") + "@start\n{c} -> [c.bdl:start]\n"},
                                   {"c.bdl", header("C") + "@start\n{x} -> [main.bdl:start]\n"}});
    REQUIRE(result.isValid);
    REQUIRE(result.hasWarnings());
    REQUIRE(countCode(result, ErrorCode::UndeclaredDependency) == 2);
    // The transfer target was loaded and checked as well
    REQUIRE(result.documentsChecked == 2);
  }

  SECTION("a missing start node") {
    auto result = validateScripts({{"main.bdl", header("Main") + "@intro\n{x} -> intro\n"}});
    REQUIRE_FALSE(result.isValid);
    REQUIRE(countCode(result, ErrorCode::MissingStartNode) == 1);
    REQUIRE(countCode(result, ErrorCode::UnreachableNode) == 0);
  }
}

TEST_CASE("Validator checks function calls against a dispatcher", "[validator]") {
  const std::string script = header("Main") + "@start\n!{getUserInpt} : ~{input}\n{x} -> start\n";

  SECTION("with a dispatcher") {
    FunctionDispatcher dispatcher;
    dispatcher.registerFunction("getUserInput",
                                [](SessionState&) { return FunctionResult::ok(); });
    auto result = validateScripts({{"main.bdl", script}}, &dispatcher);
    REQUIRE(result.isValid);
    const ScriptError* warning = findCode(result, ErrorCode::UnknownFunction);
    REQUIRE(warning != nullptr);
    REQUIRE(warning->isWarning());
    REQUIRE(warning->suggestions[0] == "Did you mean 'getUserInput'?");
  }

  SECTION("without a dispatcher") {
    auto result = validateScripts({{"main.bdl", script}});
    REQUIRE(countCode(result, ErrorCode::UnknownFunction) == 0);
  }
}

TEST_CASE("Validator flags dead ends and unreachable nodes", "[validator]") {
  auto result = validateScripts({{"main.bdl", header("Main") + "@start\n"
                                                               "?{flag} -> end\n"
                                                               "{go} -> middle\n"
                                                               "@middle\n"
                                                               "?{flag} -> end\n"
                                                               "@end\n"
                                                               "-> {exit}\n"
                                                               "@lonely\n"
                                                               "-> start\n"}});
  REQUIRE(result.isValid);

  const ScriptError* deadEnd = findCode(result, ErrorCode::DeadEndNode);
  REQUIRE(deadEnd != nullptr);
  REQUIRE(deadEnd->message.find("'middle'") != std::string::npos);
  REQUIRE(countCode(result, ErrorCode::DeadEndNode) == 1);

  const ScriptError* unreachable = findCode(result, ErrorCode::UnreachableNode);
  REQUIRE(unreachable != nullptr);
  REQUIRE(unreachable->severity == Severity::Hint);
  REQUIRE(unreachable->message.find("'lonely'") != std::string::npos);
  REQUIRE(countCode(result, ErrorCode::UnreachableNode) == 1);
}

TEST_CASE("Validator skips run-time destinations", "[validator]") {
  auto result = validateScripts({{"main.bdl", header("Main") + "$local_vars: { next: \"later\" }\n"
                                                               "@start\n"
                                                               "{a} -> ${next}\n"
                                                               "{b} -> [${module}:start]\n"
                                                               "@later\n"
                                                               "{x} -> start\n"}});
  REQUIRE(result.isValid);
  REQUIRE(result.dynamicDestinations == 2);

  // Only reachable through ${next}, so the literal walk cannot see it
  REQUIRE(countCode(result, ErrorCode::UnreachableNode) == 1);
}
