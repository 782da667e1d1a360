#include <catch2/catch_test_macros.hpp>
#include "Branchline/scripting/variable_store.hpp"

using namespace Branchline::scripting;

namespace {

Document makeEntry() {
  Document doc;
  doc.name = "main.bdl";
  doc.declaresGlobal = true;
  doc.globalDefaults["user_name"] = Value("");
  doc.globalDefaults["mode"] = Value("global");
  doc.globalDefaults["progress"] = Value::map({{"passwords", Value(true)}, {"phishing", Value(false)}});
  doc.localDefaults["input"] = Value("");
  doc.localDefaults["mode"] = Value("local");
  return doc;
}

Document makeModule() {
  Document doc;
  doc.name = "passwords.bdl";
  doc.localDefaults["attempts"] = Value(0);
  return doc;
}

} // namespace

TEST_CASE("SessionState initialization", "[variables]") {
  const Document entry = makeEntry();
  SessionState state;
  state.initialize(entry);

  REQUIRE(state.entryFile() == "main.bdl");
  REQUIRE(state.currentFile() == "main.bdl");
  REQUIRE(state.isInEntryFile());
  REQUIRE(state.globals().size() == 3);
  REQUIRE(state.locals().size() == 2);
  REQUIRE(state.currentNode().empty());
}

TEST_CASE("SessionState lookup", "[variables]") {
  const Document entry = makeEntry();
  SessionState state;
  state.initialize(entry);

  SECTION("locals shadow globals") {
    REQUIRE(state.get("mode") == Value("local"));
  }

  SECTION("unknown names resolve to empty") {
    REQUIRE(state.get("nothing").isEmpty());
    REQUIRE_FALSE(state.has("nothing"));
  }

  SECTION("dotted names walk into maps") {
    REQUIRE(state.get("progress.passwords") == Value(true));
    REQUIRE(state.get("progress.phishing") == Value(false));
    REQUIRE(state.get("progress.missing").isEmpty());
    REQUIRE(state.get("user_name.length").isEmpty());
    REQUIRE(state.has("progress.passwords"));
  }

  SECTION("setLocal adds and replaces") {
    state.setLocal("input", Value("Alex"));
    state.setLocal("fresh", Value(3));
    REQUIRE(state.get("input") == Value("Alex"));
    REQUIRE(state.get("fresh") == Value(3));
    REQUIRE(state.globals().count("fresh") == 0);
  }
}

TEST_CASE("SessionState global writes", "[variables][scope]") {
  const Document entry = makeEntry();
  const Document module = makeModule();
  SessionState state;
  state.initialize(entry);

  SECTION("accepted inside the entry file") {
    auto result = state.setGlobal("user_name", Value("Alex"));
    REQUIRE(result.isOk());
    REQUIRE(state.get("user_name") == Value("Alex"));
    REQUIRE(state.diagnostics().empty());
  }

  SECTION("dropped outside the entry file") {
    state.enterFile(module);
    REQUIRE_FALSE(state.isInEntryFile());

    auto result = state.setGlobal("user_name", Value("Mallory"));
    REQUIRE(result.isError());
    REQUIRE(result.error().code == ErrorCode::GlobalWriteOutsideEntry);
    REQUIRE(result.error().severity == Severity::Warning);
    REQUIRE(result.error().category() == ErrorCategory::Scope);

    REQUIRE(state.get("user_name") == Value(""));
    REQUIRE(state.diagnostics().size() == 1);
    REQUIRE(state.diagnostics().contains(ErrorCode::GlobalWriteOutsideEntry));
  }

  SECTION("takeDiagnostics empties the list") {
    state.enterFile(module);
    (void)state.setGlobal("user_name", Value("x"));
    ErrorList taken = state.takeDiagnostics();
    REQUIRE(taken.size() == 1);
    REQUIRE(state.diagnostics().empty());
  }
}

TEST_CASE("SessionState file changes", "[variables][scope]") {
  const Document entry = makeEntry();
  const Document module = makeModule();
  SessionState state;
  state.initialize(entry);
  REQUIRE(state.setGlobal("user_name", Value("Alex")).isOk());
  state.setLocal("input", Value("typed"));

  SECTION("entering another file resets locals and keeps globals") {
    state.enterFile(module);
    REQUIRE(state.currentFile() == "passwords.bdl");
    REQUIRE(state.locals().size() == 1);
    REQUIRE(state.get("attempts") == Value(0));
    REQUIRE(state.get("input").isEmpty());
    REQUIRE(state.get("user_name") == Value("Alex"));

    // Locals from the previous file no longer shadow globals
    REQUIRE(state.get("mode") == Value("global"));
  }

  SECTION("re-entering the current file keeps locals") {
    state.enterFile(entry);
    REQUIRE(state.get("input") == Value("typed"));
  }

  SECTION("returning to the entry file starts from its defaults again") {
    state.enterFile(module);
    state.setLocal("attempts", Value(2));
    state.enterFile(entry);
    REQUIRE(state.get("input") == Value(""));
    REQUIRE(state.get("attempts").isEmpty());
    REQUIRE(state.isInEntryFile());
  }
}

TEST_CASE("SessionState interpolation", "[variables][interpolation]") {
  const Document entry = makeEntry();
  SessionState state;
  state.initialize(entry);
  REQUIRE(state.setGlobal("user_name", Value("Alex")).isOk());
  state.setLocal("score", Value(5));

  SECTION("tokens are replaced by display strings") {
    REQUIRE(state.interpolate("Hello ${user_name}! Score: ${score}") == "Hello Alex! Score: 5");
  }

  SECTION("whitespace inside a token is ignored") {
    REQUIRE(state.interpolate("${ user_name }") == "Alex");
  }

  SECTION("unknown names render as empty text") {
    REQUIRE(state.interpolate("[${missing}]") == "[]");
  }

  SECTION("dotted names") {
    REQUIRE(state.interpolate("done: ${progress.passwords}") == "done: true");
  }

  SECTION("unterminated tokens are kept verbatim") {
    REQUIRE(state.interpolate("Hello ${user_name") == "Hello ${user_name");
    REQUIRE(state.interpolate("${score} and ${oops") == "5 and ${oops");
  }

  SECTION("text without tokens is unchanged") {
    REQUIRE(state.interpolate("Plain text, {braces} and $dollars") ==
            "Plain text, {braces} and $dollars");
  }
}
