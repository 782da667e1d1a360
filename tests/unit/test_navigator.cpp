#include <catch2/catch_test_macros.hpp>
#include "Branchline/scripting/navigator.hpp"
#include "test_helpers.hpp"

using namespace Branchline::scripting;
using Branchline::test::header;
using Branchline::test::memorySource;

namespace {

const char* MAIN_BODY = R"($global_vars: { user_name: "", flag: false }
$local_vars: { next: "second", target: "b" }

@start
Welcome ${user_name}
{go, Go Now} -> second
{jump} -> ${next}
{transfer} -> [${target}:start]
{broken} -> [b.bdl:missing]
{call} -> caller
{dead} -> dead_end
{bye} -> {exit}

@second
Second node
?{flag} -> flagged
{back} -> start

@flagged
Flagged
-> {exit}

@caller
!{unknownFn} : ~{x}
Never shown

@dead_end
Nothing here
)";

const char* MODULE_BODY = R"($local_vars: { attempts: 0 }

@start
In B: ${user_name}, attempts ${attempts}
{home} -> [main.bdl:start]
)";

struct SessionFixture {
  std::shared_ptr<MemoryScriptSource> source = memorySource();
  DocumentRegistry registry{source};
  FunctionDispatcher dispatcher;

  SessionFixture() {
    source->add("main.bdl", header("Main", "b.bdl") + MAIN_BODY);
    source->add("b.bdl", header("B", "main.bdl") + MODULE_BODY);
  }
};

} // namespace

TEST_CASE("Navigator starts at the start node", "[navigator]") {
  SessionFixture f;
  Navigator nav(f.registry, f.dispatcher);
  REQUIRE(nav.status() == SessionStatus::NotStarted);

  Output out = nav.start("main");
  REQUIRE_FALSE(out.exited);
  REQUIRE(out.segments.size() == 1);
  REQUIRE(out.segments[0].kind == OutputSegment::Kind::Text);
  REQUIRE(out.segments[0].text == "Welcome ");
  REQUIRE(out.diagnostics.empty());

  REQUIRE(nav.status() == SessionStatus::AwaitingInput);
  REQUIRE(nav.currentFile() == "main.bdl");
  REQUIRE(nav.currentNode() == "start");
}

TEST_CASE("Navigator matches input against options", "[navigator]") {
  SessionFixture f;
  Navigator nav(f.registry, f.dispatcher);
  (void)nav.start("main.bdl");

  SECTION("matching is case-insensitive and ignores surrounding spaces") {
    Output out = nav.submitInput("  GO now ");
    REQUIRE(out.text() == "Second node");
    REQUIRE(nav.currentNode() == "second");
    REQUIRE(nav.state().lastInput() == "GO now");
  }

  SECTION("unmatched input re-prompts and changes nothing") {
    Output out = nav.submitInput("fly away");
    REQUIRE(out.segments.size() == 1);
    REQUIRE(out.segments[0].kind == OutputSegment::Kind::Reprompt);
    REQUIRE(out.segments[0].text == nav.options().repromptMessage);
    REQUIRE(nav.status() == SessionStatus::AwaitingInput);
    REQUIRE(nav.currentNode() == "start");
    REQUIRE(nav.state().lastInput().empty());
  }

  SECTION("empty input never matches") {
    Output out = nav.submitInput("   ");
    REQUIRE(out.hasSegment(OutputSegment::Kind::Reprompt));
  }

  SECTION("a keyword must match the whole line") {
    Output out = nav.submitInput("go now please");
    REQUIRE(out.hasSegment(OutputSegment::Kind::Reprompt));
  }

  SECTION("exit ends the session") {
    Output out = nav.submitInput("bye");
    REQUIRE(out.exited);
    REQUIRE(out.segments.empty());
    REQUIRE(nav.isExited());

    Output after = nav.submitInput("go");
    REQUIRE(after.exited);
    REQUIRE(after.segments.empty());
  }
}

TEST_CASE("Navigator follows destinations", "[navigator]") {
  SessionFixture f;
  Navigator nav(f.registry, f.dispatcher);
  (void)nav.start("main");

  SECTION("a variable destination") {
    Output out = nav.submitInput("jump");
    REQUIRE(out.text() == "Second node");
    REQUIRE(nav.currentNode() == "second");
  }

  SECTION("an interpolated file transfer resets locals") {
    Output out = nav.submitInput("transfer");
    REQUIRE(out.text() == "In B: , attempts 0");
    REQUIRE(nav.currentFile() == "b.bdl");
    REQUIRE(nav.currentNode() == "start");
    REQUIRE(nav.state().get("next").isEmpty());

    Output back = nav.submitInput("home");
    REQUIRE(back.text() == "Welcome ");
    REQUIRE(nav.currentFile() == "main.bdl");
    REQUIRE(nav.state().get("next") == Value("second"));
  }

  SECTION("a truthy condition transitions during rendering") {
    REQUIRE(nav.state().setGlobal("flag", Value(true)).isOk());
    Output out = nav.submitInput("go");
    REQUIRE(out.segments.size() == 2);
    REQUIRE(out.segments[0].text == "Second node");
    REQUIRE(out.segments[1].text == "Flagged");
    REQUIRE(out.exited);
  }

  SECTION("a falsy condition waits for input") {
    Output out = nav.submitInput("go");
    REQUIRE_FALSE(out.exited);
    REQUIRE(nav.status() == SessionStatus::AwaitingInput);
  }
}

TEST_CASE("Navigator recovers from reference errors", "[navigator][errors]") {
  SessionFixture f;

  SECTION("an unknown node falls back to the entry start node") {
    Navigator nav(f.registry, f.dispatcher);
    (void)nav.start("main");

    Output out = nav.submitInput("broken");
    REQUIRE(out.segments.size() == 2);
    REQUIRE(out.segments[0].kind == OutputSegment::Kind::Fallback);
    REQUIRE(out.segments[0].text == "Sorry, something went wrong. Let's start over.");
    REQUIRE(out.segments[1].text == "Welcome ");
    REQUIRE(out.diagnostics.contains(ErrorCode::UnknownNode));
    REQUIRE_FALSE(out.diagnostics.hasErrors());
    REQUIRE(nav.status() == SessionStatus::AwaitingInput);
    REQUIRE(nav.currentNode() == "start");
  }

  SECTION("an unknown function falls back") {
    Navigator nav(f.registry, f.dispatcher);
    (void)nav.start("main");

    Output out = nav.submitInput("call");
    REQUIRE(out.hasSegment(OutputSegment::Kind::Fallback));
    REQUIRE_FALSE(out.contains("Never shown"));
    REQUIRE(out.diagnostics.contains(ErrorCode::UnknownFunction));
    REQUIRE(nav.currentNode() == "start");
  }

  SECTION("a configured fallback destination") {
    NavigatorOptions options;
    options.fallback.message = "Let's go somewhere safe.";
    options.fallback.destination = "second";
    Navigator nav(f.registry, f.dispatcher, options);
    (void)nav.start("main");

    Output out = nav.submitInput("broken");
    REQUIRE(out.text() == "Let's go somewhere safe.\nSecond node");
    REQUIRE(nav.currentNode() == "second");
  }

  SECTION("an unusable fallback halts the session") {
    NavigatorOptions options;
    options.fallback.destination = "nowhere.bdl:start";
    Navigator nav(f.registry, f.dispatcher, options);
    (void)nav.start("main");

    Output out = nav.submitInput("broken");
    REQUIRE(out.exited);
    REQUIRE(out.segments.size() == 2);
    REQUIRE(out.segments[0].kind == OutputSegment::Kind::Fallback);
    REQUIRE(out.segments[1].kind == OutputSegment::Kind::Error);
    REQUIRE(out.diagnostics.contains(ErrorCode::FallbackUnresolved));
    REQUIRE(nav.isExited());
  }
}

TEST_CASE("Navigator falls back after a failed host call", "[navigator][errors]") {
  auto source = memorySource();
  source->add("main.bdl", header("Main") + R"(@start
Start
{work} -> work
{routed} -> routed

@work
!{check} : ~{msg} ~{next}
${msg}
{retry} -> work

@routed
!{check} : ~{msg}
-> elsewhere

@elsewhere
Handled by the script
{back} -> start
)");
  DocumentRegistry registry(source);
  FunctionDispatcher dispatcher;
  dispatcher.registerFunction("check",
                              [](SessionState&) { return FunctionResult::failure("offline"); });

  Navigator nav(registry, dispatcher);
  (void)nav.start("main");

  SECTION("a node with only options moves to the fallback destination") {
    Output out = nav.submitInput("work");
    REQUIRE(out.text() == "Sorry, something went wrong. Let's start over.\nStart");
    REQUIRE(out.segments[0].kind == OutputSegment::Kind::Text);
    REQUIRE(out.diagnostics.contains(ErrorCode::FunctionFailed));
    REQUIRE_FALSE(out.exited);
    REQUIRE(nav.status() == SessionStatus::AwaitingInput);
    REQUIRE(nav.currentNode() == "start");
    REQUIRE(nav.state().get("next") == Value("main.bdl:start"));
  }

  SECTION("a transition written after the call takes precedence") {
    Output out = nav.submitInput("routed");
    REQUIRE(out.text() == "Handled by the script");
    REQUIRE(out.diagnostics.contains(ErrorCode::FunctionFailed));
    REQUIRE(nav.currentNode() == "elsewhere");
  }
}

TEST_CASE("Navigator dead ends", "[navigator]") {
  SessionFixture f;
  Navigator nav(f.registry, f.dispatcher);
  (void)nav.start("main");

  Output out = nav.submitInput("dead");
  REQUIRE(out.text() == "Nothing here");
  REQUIRE(out.diagnostics.contains(ErrorCode::DeadEndNode));
  REQUIRE(nav.status() == SessionStatus::AwaitingInput);

  Output again = nav.submitInput("anything");
  REQUIRE(again.hasSegment(OutputSegment::Kind::Reprompt));
  REQUIRE(nav.currentNode() == "dead_end");
}

TEST_CASE("Navigator halts on unrecoverable problems", "[navigator][errors]") {
  auto source = memorySource();
  FunctionDispatcher dispatcher;

  SECTION("input before start") {
    DocumentRegistry registry(source);
    Navigator nav(registry, dispatcher);
    Output out = nav.submitInput("hello");
    REQUIRE(out.hasSegment(OutputSegment::Kind::Error));
    REQUIRE(out.diagnostics.contains(ErrorCode::SessionNotStarted));
    REQUIRE_FALSE(out.exited);
    REQUIRE(nav.status() == SessionStatus::NotStarted);
  }

  SECTION("an entry file that does not parse") {
    source->add("main.bdl", header("Main") + "@start\n@start\n");
    DocumentRegistry registry(source);
    Navigator nav(registry, dispatcher);

    Output out = nav.start("main");
    REQUIRE(out.exited);
    REQUIRE(out.hasSegment(OutputSegment::Kind::Error));
    REQUIRE(out.diagnostics.contains(ErrorCode::DuplicateNode));
    REQUIRE(nav.isExited());
  }

  SECTION("an entry file without a start node") {
    source->add("main.bdl", header("Main") + "@intro\nHello\n");
    DocumentRegistry registry(source);
    Navigator nav(registry, dispatcher);

    Output out = nav.start("main");
    REQUIRE(out.exited);
    REQUIRE(out.diagnostics.contains(ErrorCode::UnknownNode));
    REQUIRE(out.diagnostics.contains(ErrorCode::FallbackUnresolved));
  }

  SECTION("a custom start node") {
    source->add("main.bdl", header("Main") + "@intro\nHello\n{x} -> intro\n");
    DocumentRegistry registry(source);
    NavigatorOptions options;
    options.startNode = "intro";
    Navigator nav(registry, dispatcher, options);

    Output out = nav.start("main");
    REQUIRE(out.text() == "Hello");
    REQUIRE(nav.options().fallback.startNode == "intro");
  }

  SECTION("too many transitions without input") {
    source->add("main.bdl",
                header("Main") + "@start\n-> loop_a\n@loop_a\n-> loop_b\n@loop_b\n-> loop_a\n");
    DocumentRegistry registry(source);
    NavigatorOptions options;
    options.maxChainedTransitions = 5;
    Navigator nav(registry, dispatcher, options);

    Output out = nav.start("main");
    REQUIRE(out.exited);
    REQUIRE(out.diagnostics.contains(ErrorCode::TransitionLimitExceeded));
    REQUIRE(nav.isExited());
  }
}

TEST_CASE("Navigator enforces global write scope", "[navigator][scope]") {
  auto source = memorySource();
  source->add("main.bdl", header("Main", "mod.bdl") +
                              "$global_vars: { user_name: \"\" }\n@start\n{go} -> [mod.bdl:start]\n");
  source->add("mod.bdl", header("Mod") +
                             "@start\n!{rename} : ~{renamed}\nName: '${user_name}' ${renamed}\n"
                             "{back} -> [main.bdl:start]\n");
  DocumentRegistry registry(source);

  FunctionDispatcher dispatcher;
  dispatcher.registerFunction("rename", [](SessionState& s) {
    auto written = s.setGlobal("user_name", Value("Mallory"));
    return FunctionResult::ok({Value(written.isOk())});
  });

  Navigator nav(registry, dispatcher);
  (void)nav.start("main");
  Output out = nav.submitInput("go");

  REQUIRE(out.text() == "Name: '' false");
  REQUIRE(out.diagnostics.contains(ErrorCode::GlobalWriteOutsideEntry));
  REQUIRE_FALSE(out.exited);
  REQUIRE(nav.state().globals().at("user_name") == Value(""));
}

TEST_CASE("Navigator sessions sharing a registry are independent", "[navigator]") {
  SessionFixture f;
  Navigator first(f.registry, f.dispatcher);
  Navigator second(f.registry, f.dispatcher);
  (void)first.start("main");
  (void)second.start("main");

  REQUIRE(first.state().setGlobal("user_name", Value("Alex")).isOk());
  (void)first.submitInput("transfer");

  REQUIRE(first.currentFile() == "b.bdl");
  REQUIRE(second.currentFile() == "main.bdl");
  REQUIRE(second.state().get("user_name") == Value(""));

  Output out = second.submitInput("go");
  REQUIRE(out.text() == "Second node");
}
