#pragma once

/**
 * @file function_dispatcher.hpp
 * @brief Host functions callable from scripts with `!{name} : ~{a} ~{b}`
 *
 * A host function receives the calling session's state (it may read and
 * write variables through the usual scope rules) and returns an ordered list
 * of values or a failure. Values are bound to the call's bindings as locals:
 * missing values bind Empty, extra values are dropped.
 *
 * When a host function fails, the first binding receives the fallback
 * message and the second the fallback destination ("file:node"), so the
 * script can route the session with `-> ${next}`. The dispatcher holds no
 * session data and can be shared by any number of sessions.
 */

#include "Branchline/core/result.hpp"
#include "Branchline/scripting/document.hpp"
#include "Branchline/scripting/script_error.hpp"
#include "Branchline/scripting/value.hpp"
#include "Branchline/scripting/variable_store.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Branchline::scripting {

/**
 * @brief What a host function returns
 */
struct FunctionResult {
  bool success = true;
  std::vector<Value> values;
  std::string error; ///< Reason, when success is false

  [[nodiscard]] static FunctionResult ok(std::vector<Value> values = {}) {
    FunctionResult r;
    r.values = std::move(values);
    return r;
  }

  [[nodiscard]] static FunctionResult failure(std::string reason) {
    FunctionResult r;
    r.success = false;
    r.error = std::move(reason);
    return r;
  }
};

using HostFunction = std::function<FunctionResult(SessionState&)>;

/**
 * @brief Where a session goes, and what it says, when something fails
 */
struct FallbackPolicy {
  std::string message = "Sorry, something went wrong. Let's start over.";
  std::string destination; ///< "file:node" or "node"; empty means "<entry>:<startNode>"
  std::string startNode = "start";

  /// The destination with the default applied for @p state's entry file
  [[nodiscard]] std::string resolveDestination(const SessionState& state) const;
};

/**
 * @brief How a dispatched call went
 */
struct CallOutcome {
  bool hostFailed = false;
  std::string failureReason;
  usize boundCount = 0;
};

class FunctionDispatcher {
public:
  FunctionDispatcher() = default;

  void registerFunction(const std::string& name, HostFunction function);
  bool unregisterFunction(const std::string& name);

  [[nodiscard]] bool hasFunction(const std::string& name) const;

  /// Registered names, sorted
  [[nodiscard]] std::vector<std::string> functionNames() const;

  /**
   * @brief Run the call's host function and bind its results
   *
   * Fails with UnknownFunction when nothing is registered under the name. A
   * failing host function is not an error here: the fallback values are
   * bound and the outcome reports hostFailed.
   */
  Result<CallOutcome, ScriptError> dispatch(const CallElement& call, SessionState& state,
                                            const FallbackPolicy& fallback = {}) const;

private:
  std::unordered_map<std::string, HostFunction> m_functions;
};

} // namespace Branchline::scripting
