#include "Branchline/scripting/navigator.hpp"
#include "Branchline/core/logger.hpp"
#include <cctype>
#include <utility>

namespace Branchline::scripting {

namespace {

std::string_view trimView(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

std::string stripNodePrefix(std::string_view node) {
  node = trimView(node);
  if (!node.empty() && node.front() == '@') {
    node.remove_prefix(1);
  }
  return std::string(node);
}

} // namespace

const char* sessionStatusName(SessionStatus status) {
  switch (status) {
  case SessionStatus::NotStarted:
    return "NotStarted";
  case SessionStatus::Rendering:
    return "Rendering";
  case SessionStatus::AwaitingInput:
    return "AwaitingInput";
  case SessionStatus::Transferring:
    return "Transferring";
  case SessionStatus::Exited:
    return "Exited";
  }
  return "Unknown";
}

// =============================================================================
// Output
// =============================================================================

std::string Output::text() const {
  std::string out;
  for (const auto& segment : segments) {
    if (!out.empty()) {
      out += '\n';
    }
    out += segment.text;
  }
  return out;
}

bool Output::contains(std::string_view needle) const {
  return text().find(needle) != std::string::npos;
}

bool Output::hasSegment(OutputSegment::Kind kind) const {
  for (const auto& segment : segments) {
    if (segment.kind == kind) {
      return true;
    }
  }
  return false;
}

// =============================================================================
// Navigator
// =============================================================================

Navigator::Navigator(DocumentRegistry& registry, const FunctionDispatcher& dispatcher,
                     NavigatorOptions options)
    : m_registry(registry), m_dispatcher(dispatcher), m_options(std::move(options)) {
  m_options.fallback.startNode = m_options.startNode;
}

Output Navigator::start(const std::string& entryFile) {
  m_output = Output{};
  m_transitions = 0;
  m_recovering = false;
  m_node = nullptr;

  auto entry = m_registry.loadEntry(entryFile);
  if (entry.isError()) {
    halt(entry.error());
    return std::exchange(m_output, Output{});
  }

  const Document* document = entry.value();
  m_state.initialize(*document);
  BRANCHLINE_LOG_INFO("Session started at {}:{}", document->name, m_options.startNode);

  m_status = SessionStatus::Transferring;
  moveTo(Target{document->name, m_options.startNode});
  run();

  return std::exchange(m_output, Output{});
}

Output Navigator::submitInput(std::string_view line) {
  m_output = Output{};
  m_transitions = 0;

  if (m_status == SessionStatus::NotStarted) {
    ScriptError error(ErrorCode::SessionNotStarted, Severity::Error,
                      "Input received before the session was started");
    emit(OutputSegment::Kind::Error, error.format());
    m_output.diagnostics.add(std::move(error));
    return std::exchange(m_output, Output{});
  }
  if (m_status == SessionStatus::Exited) {
    m_output.exited = true;
    return std::exchange(m_output, Output{});
  }
  if (m_status != SessionStatus::AwaitingInput || !m_node) {
    return std::exchange(m_output, Output{});
  }

  const std::string normalized = normalizeInput(line);
  for (const auto& branch : m_node->branches) {
    const auto* option = std::get_if<OptionBranch>(&branch);
    if (!option || !option->matches(normalized)) {
      continue;
    }

    BRANCHLINE_LOG_DEBUG("Input '{}' matched an option of {}:{}", normalized,
                         m_state.currentFile(), m_node->name);
    m_state.setLastInput(std::string(trimView(line)));
    follow(option->destination);
    run();
    return std::exchange(m_output, Output{});
  }

  emit(OutputSegment::Kind::Reprompt, m_options.repromptMessage);
  return std::exchange(m_output, Output{});
}

void Navigator::run() {
  while (m_status == SessionStatus::Rendering && m_node) {
    render(*m_node);
  }
}

void Navigator::render(const Node& node) {
  bool hostFailed = false;
  for (const auto& element : node.content) {
    if (const auto* text = std::get_if<TextElement>(&element)) {
      emit(OutputSegment::Kind::Text, m_state.interpolate(text->text));
      continue;
    }

    const auto& call = std::get<CallElement>(element);
    auto result = m_dispatcher.dispatch(call, m_state, m_options.fallback);
    collectStateDiagnostics();

    if (result.isError()) {
      recover(result.error());
      return;
    }
    if (result.value().hostFailed) {
      hostFailed = true;
      m_output.diagnostics
          .addWarning(ErrorCode::FunctionFailed,
                      "Host function '" + call.function + "' failed: " +
                          result.value().failureReason,
                      call.location)
          .withFilePath(m_state.currentFile());
    }
  }

  for (const auto& branch : node.branches) {
    if (const auto* condition = std::get_if<ConditionBranch>(&branch)) {
      if (asBool(m_state.get(condition->variable))) {
        follow(condition->destination);
        return;
      }
    } else if (const auto* jump = std::get_if<GotoBranch>(&branch)) {
      follow(jump->destination);
      return;
    }
  }

  // A script may route a failed call itself; otherwise the session falls back
  if (hostFailed) {
    BRANCHLINE_LOG_WARN("Host call failed in {}:{}; using the fallback destination",
                        m_state.currentFile(), node.name);
    m_status = SessionStatus::Transferring;
    moveToFallback();
    return;
  }

  if (!node.hasOptions()) {
    BRANCHLINE_LOG_WARN("{}:{} has no options; the session cannot leave it",
                        m_state.currentFile(), node.name);
    m_output.diagnostics
        .addWarning(ErrorCode::DeadEndNode, "Node '" + node.name + "' has no way out",
                    node.location)
        .withFilePath(m_state.currentFile());
  }
  m_status = SessionStatus::AwaitingInput;
}

void Navigator::follow(const Destination& destination) {
  m_status = SessionStatus::Transferring;

  auto target = evaluate(destination);
  if (target.isError()) {
    recover(target.error());
    return;
  }
  moveTo(target.value());
}

Result<Navigator::Target, ScriptError> Navigator::evaluate(const Destination& destination) const {
  using TargetResult = Result<Target, ScriptError>;

  if (std::holds_alternative<ExitTarget>(destination)) {
    Target target;
    target.exit = true;
    return TargetResult::ok(std::move(target));
  }

  if (const auto* node = std::get_if<NodeTarget>(&destination)) {
    return TargetResult::ok(Target{m_state.currentFile(), node->node});
  }

  if (const auto* transfer = std::get_if<FileTransferTarget>(&destination)) {
    Target target;
    target.file = normalizeScriptName(m_state.interpolate(transfer->file));
    target.node = stripNodePrefix(m_state.interpolate(transfer->node));
    if (target.file.empty()) {
      return TargetResult::error(ScriptError(ErrorCode::UnknownFile, Severity::Error,
                                             "Transfer '" + describeDestination(destination) +
                                                 "' names no file"));
    }
    if (target.node.empty()) {
      return TargetResult::error(ScriptError(ErrorCode::UnknownNode, Severity::Error,
                                             "Transfer '" + describeDestination(destination) +
                                                 "' names no node"));
    }
    return TargetResult::ok(std::move(target));
  }

  const auto& dynamic = std::get<DynamicTarget>(destination);
  const std::string value = toDisplayString(m_state.get(dynamic.variable));
  if (trimView(value).empty()) {
    return TargetResult::error(ScriptError(ErrorCode::UnknownNode, Severity::Error,
                                           "Variable '" + dynamic.variable +
                                               "' holds no destination"));
  }
  return TargetResult::ok(parseTarget(value));
}

Navigator::Target Navigator::parseTarget(std::string_view text) const {
  text = trimView(text);
  if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
    text = trimView(text.substr(1, text.size() - 2));
  }

  Target target;
  if (normalizeInput(text) == "{exit}") {
    target.exit = true;
    return target;
  }

  const auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    target.file = m_state.currentFile();
    target.node = stripNodePrefix(text);
  } else {
    target.file = normalizeScriptName(text.substr(0, colon));
    target.node = stripNodePrefix(text.substr(colon + 1));
  }
  return target;
}

void Navigator::moveTo(const Target& target) {
  if (target.exit) {
    BRANCHLINE_LOG_DEBUG("Session exited from {}:{}", m_state.currentFile(),
                         m_state.currentNode());
    m_status = SessionStatus::Exited;
    m_output.exited = true;
    m_node = nullptr;
    return;
  }

  if (++m_transitions > m_options.maxChainedTransitions) {
    halt(ScriptError(ErrorCode::TransitionLimitExceeded, Severity::Error,
                     "More than " + std::to_string(m_options.maxChainedTransitions) +
                         " transitions without waiting for input (last target " + target.file +
                         ":" + target.node + ")"));
    return;
  }

  auto node = m_registry.resolve(target.file, target.node);
  if (node.isError()) {
    recover(node.error());
    return;
  }

  const Document* document = m_registry.find(target.file);
  if (!document) {
    recover(ScriptError(ErrorCode::UnknownFile, Severity::Error,
                        "Script '" + target.file + "' is not loaded"));
    return;
  }

  m_state.enterFile(*document);
  m_state.setCurrentNode(node.value()->name);
  m_node = node.value();
  m_status = SessionStatus::Rendering;
  BRANCHLINE_LOG_DEBUG("Now at {}:{}", document->name, m_node->name);
}

void Navigator::recover(ScriptError error) {
  if (m_recovering) {
    halt(ScriptError(ErrorCode::FallbackUnresolved, Severity::Error,
                     "Fallback destination '" + m_options.fallback.resolveDestination(m_state) +
                         "' cannot be used: " + error.message));
    return;
  }

  error.severity = Severity::Warning;
  if (!error.filePath && !m_state.currentFile().empty()) {
    error.withFilePath(m_state.currentFile());
  }
  BRANCHLINE_LOG_WARN("{}; using the fallback destination", error.format());
  m_output.diagnostics.add(std::move(error));
  emit(OutputSegment::Kind::Fallback, m_options.fallback.message);
  moveToFallback();
}

void Navigator::moveToFallback() {
  m_recovering = true;
  moveTo(parseTarget(m_options.fallback.resolveDestination(m_state)));
  m_recovering = false;
}

void Navigator::halt(ScriptError error) {
  error.severity = Severity::Error;
  BRANCHLINE_LOG_ERROR("Session halted: {}", error.format());
  emit(OutputSegment::Kind::Error, error.format());
  m_output.diagnostics.add(std::move(error));
  m_status = SessionStatus::Exited;
  m_output.exited = true;
  m_node = nullptr;
}

void Navigator::emit(OutputSegment::Kind kind, std::string text) {
  m_output.segments.push_back(OutputSegment{kind, std::move(text)});
}

void Navigator::collectStateDiagnostics() {
  if (!m_state.diagnostics().empty()) {
    m_output.diagnostics.append(m_state.takeDiagnostics());
  }
}

} // namespace Branchline::scripting
