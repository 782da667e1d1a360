#include "Branchline/scripting/function_dispatcher.hpp"
#include "Branchline/core/logger.hpp"
#include <algorithm>
#include <exception>

namespace Branchline::scripting {

std::string FallbackPolicy::resolveDestination(const SessionState& state) const {
  if (!destination.empty()) {
    return destination;
  }
  return state.entryFile() + ":" + startNode;
}

void FunctionDispatcher::registerFunction(const std::string& name, HostFunction function) {
  if (m_functions.count(name) > 0) {
    BRANCHLINE_LOG_DEBUG("Replacing host function '{}'", name);
  }
  m_functions[name] = std::move(function);
}

bool FunctionDispatcher::unregisterFunction(const std::string& name) {
  return m_functions.erase(name) > 0;
}

bool FunctionDispatcher::hasFunction(const std::string& name) const {
  return m_functions.count(name) > 0;
}

std::vector<std::string> FunctionDispatcher::functionNames() const {
  std::vector<std::string> names;
  names.reserve(m_functions.size());
  for (const auto& [name, function] : m_functions) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

Result<CallOutcome, ScriptError> FunctionDispatcher::dispatch(const CallElement& call,
                                                              SessionState& state,
                                                              const FallbackPolicy& fallback) const {
  auto it = m_functions.find(call.function);
  if (it == m_functions.end() || !it->second) {
    ScriptError error(ErrorCode::UnknownFunction, Severity::Error,
                      "Unknown function '" + call.function + "'", call.location);
    error.withFilePath(state.currentFile());
    for (const auto& candidate : findSimilarStrings(call.function, functionNames())) {
      error.withSuggestion("Did you mean '" + candidate + "'?");
    }
    return Result<CallOutcome, ScriptError>::error(std::move(error));
  }

  FunctionResult result;
  try {
    result = it->second(state);
  } catch (const std::exception& e) {
    result = FunctionResult::failure(e.what());
  }

  CallOutcome outcome;
  if (!result.success) {
    BRANCHLINE_LOG_WARN("Host function '{}' failed: {}", call.function, result.error);
    outcome.hostFailed = true;
    outcome.failureReason = result.error;

    // Fallback values take the place of whatever the function would have returned
    result.values = {Value(fallback.message), Value(fallback.resolveDestination(state))};
  }

  for (usize i = 0; i < call.bindings.size(); ++i) {
    if (i < result.values.size()) {
      state.setLocal(call.bindings[i], std::move(result.values[i]));
      ++outcome.boundCount;
    } else {
      state.setLocal(call.bindings[i], Value{});
    }
  }
  if (result.values.size() > call.bindings.size()) {
    BRANCHLINE_LOG_TRACE("'{}' returned {} value(s) for {} binding(s); extras dropped",
                         call.function, result.values.size(), call.bindings.size());
  }

  return Result<CallOutcome, ScriptError>::ok(std::move(outcome));
}

} // namespace Branchline::scripting
