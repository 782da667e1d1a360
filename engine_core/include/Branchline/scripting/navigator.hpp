#pragma once

/**
 * @file navigator.hpp
 * @brief Session engine: renders nodes, matches input, moves between nodes
 *
 * State machine:
 * - Rendering: content is emitted in order (text interpolated, calls
 *   dispatched), then branches are checked in source order. A truthy
 *   condition or an unconditional `-> dest` transitions at once; otherwise
 *   the session waits for input.
 * - AwaitingInput: the next input line is normalized and compared with the
 *   node's options in source order. No match re-prompts and changes nothing.
 * - Transferring: a destination is being resolved (file switch included).
 * - Exited: `{exit}` was reached or the session halted on an unrecoverable
 *   error.
 *
 * Unknown nodes, files and functions do not crash the session: the fallback
 * message is emitted and the session moves to the fallback destination.
 * A failed host call binds the fallback message and destination; when no
 * condition or unconditional transition of the node fires after it, the
 * session moves to the fallback destination as well.
 *
 * One Navigator is one session. The registry and dispatcher it uses may be
 * shared with other sessions.
 */

#include "Branchline/core/types.hpp"
#include "Branchline/scripting/document_registry.hpp"
#include "Branchline/scripting/function_dispatcher.hpp"
#include "Branchline/scripting/script_error.hpp"
#include "Branchline/scripting/variable_store.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace Branchline::scripting {

enum class SessionStatus : u8 { NotStarted, Rendering, AwaitingInput, Transferring, Exited };

[[nodiscard]] const char* sessionStatusName(SessionStatus status);

struct OutputSegment {
  enum class Kind : u8 {
    Text,     ///< Rendered node content
    Reprompt, ///< Input did not match any option
    Fallback, ///< Fallback message after a recovered error
    Error     ///< The session halted
  };

  Kind kind = Kind::Text;
  std::string text;

  bool operator==(const OutputSegment&) const = default;
};

/**
 * @brief Everything emitted since the previous start()/submitInput() call
 */
struct Output {
  std::vector<OutputSegment> segments;
  bool exited = false;
  ErrorList diagnostics; ///< Recovered errors and warnings raised during the step

  /// All segment texts joined with '\n'
  [[nodiscard]] std::string text() const;

  [[nodiscard]] bool contains(std::string_view needle) const;
  [[nodiscard]] bool hasSegment(OutputSegment::Kind kind) const;
};

struct NavigatorOptions {
  std::string startNode = "start";
  FallbackPolicy fallback;
  std::string repromptMessage = "I didn't understand that. Please choose one of the options.";
  u32 maxChainedTransitions = 64;
};

class Navigator {
public:
  Navigator(DocumentRegistry& registry, const FunctionDispatcher& dispatcher,
            NavigatorOptions options = {});

  /**
   * @brief Load the entry file and render its start node
   *
   * A parse or dependency error in the entry file ends the session at once
   * (the output carries an Error segment and exited is set).
   */
  Output start(const std::string& entryFile);

  /**
   * @brief Feed one line of user input
   */
  Output submitInput(std::string_view line);

  [[nodiscard]] SessionStatus status() const { return m_status; }
  [[nodiscard]] bool isExited() const { return m_status == SessionStatus::Exited; }

  [[nodiscard]] const SessionState& state() const { return m_state; }
  [[nodiscard]] SessionState& state() { return m_state; }

  [[nodiscard]] const std::string& currentFile() const { return m_state.currentFile(); }
  [[nodiscard]] const std::string& currentNode() const { return m_state.currentNode(); }

  [[nodiscard]] const NavigatorOptions& options() const { return m_options; }

private:
  struct Target {
    std::string file;
    std::string node;
    bool exit = false;
  };

  void run();
  void render(const Node& node);

  void follow(const Destination& destination);
  [[nodiscard]] Result<Target, ScriptError> evaluate(const Destination& destination) const;
  [[nodiscard]] Target parseTarget(std::string_view text) const;
  void moveTo(const Target& target);

  void recover(ScriptError error);
  void moveToFallback();
  void halt(ScriptError error);

  void emit(OutputSegment::Kind kind, std::string text);
  void collectStateDiagnostics();

  DocumentRegistry& m_registry;
  const FunctionDispatcher& m_dispatcher;
  NavigatorOptions m_options;

  SessionState m_state;
  SessionStatus m_status = SessionStatus::NotStarted;
  const Node* m_node = nullptr;

  Output m_output;
  u32 m_transitions = 0;
  bool m_recovering = false;
};

} // namespace Branchline::scripting
