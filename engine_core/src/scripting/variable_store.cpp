#include "Branchline/scripting/variable_store.hpp"
#include "Branchline/core/logger.hpp"

namespace Branchline::scripting {

void SessionState::initialize(const Document& entry) {
  m_globals = entry.globalDefaults;
  m_locals = entry.localDefaults;
  m_entryFile = entry.name;
  m_currentFile = entry.name;
  m_currentNode.clear();
  m_lastInput.clear();
  m_diagnostics.clear();
}

void SessionState::enterFile(const Document& document) {
  if (document.name == m_currentFile) {
    return;
  }
  BRANCHLINE_LOG_DEBUG("Entering {}: resetting {} local variable(s)", document.name,
                       document.localDefaults.size());
  m_currentFile = document.name;
  m_locals = document.localDefaults;
}

const Value* SessionState::lookup(const VariableMap& store, std::string_view name) {
  const auto dot = name.find('.');
  auto it = store.find(std::string(name.substr(0, dot)));
  if (it == store.end()) {
    return nullptr;
  }

  const Value* current = &it->second;
  while (current && dot != std::string_view::npos) {
    name.remove_prefix(name.find('.') + 1);
    const auto next = name.find('.');
    current = current->find(name.substr(0, next));
    if (next == std::string_view::npos) {
      break;
    }
  }
  return current;
}

Value SessionState::get(std::string_view name) const {
  if (const Value* v = lookup(m_locals, name)) {
    return *v;
  }
  if (const Value* v = lookup(m_globals, name)) {
    return *v;
  }
  return Value{};
}

bool SessionState::has(std::string_view name) const {
  return lookup(m_locals, name) != nullptr || lookup(m_globals, name) != nullptr;
}

void SessionState::setLocal(const std::string& name, Value value) {
  m_locals[name] = std::move(value);
}

Result<void, ScriptError> SessionState::setGlobal(const std::string& name, Value value) {
  if (!isInEntryFile()) {
    ScriptError error(ErrorCode::GlobalWriteOutsideEntry, Severity::Warning,
                      "Global '" + name + "' can only be written from " + m_entryFile +
                          "; the write from " + m_currentFile + " was dropped");
    error.withFilePath(m_currentFile);
    BRANCHLINE_LOG_WARN("{}", error.format());
    m_diagnostics.add(error);
    return Result<void, ScriptError>::error(std::move(error));
  }

  m_globals[name] = std::move(value);
  return Result<void, ScriptError>::ok();
}

std::string SessionState::interpolate(std::string_view text) const {
  std::string out;
  out.reserve(text.size());

  usize pos = 0;
  while (pos < text.size()) {
    const auto open = text.find("${", pos);
    if (open == std::string_view::npos) {
      break;
    }
    const auto close = text.find('}', open + 2);
    if (close == std::string_view::npos) {
      break;
    }

    out.append(text.substr(pos, open - pos));

    std::string_view name = text.substr(open + 2, close - open - 2);
    while (!name.empty() && name.front() == ' ') {
      name.remove_prefix(1);
    }
    while (!name.empty() && name.back() == ' ') {
      name.remove_suffix(1);
    }
    if (!name.empty()) {
      out += toDisplayString(get(name));
    }
    pos = close + 1;
  }

  out.append(text.substr(pos));
  return out;
}

ErrorList SessionState::takeDiagnostics() {
  ErrorList taken = std::move(m_diagnostics);
  m_diagnostics.clear();
  return taken;
}

} // namespace Branchline::scripting
