#pragma once

/**
 * @file variable_store.hpp
 * @brief Per-session variable scopes and ${name} interpolation
 *
 * A SessionState owns two stores:
 * - the global store, seeded once from the entry document's $global_vars and
 *   kept for the whole session;
 * - the local store, reset to the current document's $local_vars every time
 *   the session moves into a different file.
 *
 * Lookups check the local store first. Global writes are only accepted while
 * the session is executing inside the entry file; anywhere else the write is
 * dropped and a ScopeError warning is recorded.
 *
 * A SessionState belongs to exactly one session and is not thread-safe.
 */

#include "Branchline/core/result.hpp"
#include "Branchline/scripting/document.hpp"
#include "Branchline/scripting/script_error.hpp"
#include "Branchline/scripting/value.hpp"
#include <string>
#include <string_view>

namespace Branchline::scripting {

class SessionState {
public:
  SessionState() = default;

  /**
   * @brief Seed both stores from the entry document and make it current
   */
  void initialize(const Document& entry);

  /**
   * @brief Make @p document the current file
   *
   * Locals are reset to the document's defaults only when the file actually
   * changes; globals are never touched.
   */
  void enterFile(const Document& document);

  // =========================================================================
  // Lookup and assignment
  // =========================================================================

  /**
   * @brief Value of @p name, local first, then global
   *
   * Dotted names ("progress.passwords") walk into map values. Unknown names
   * resolve to Empty.
   */
  [[nodiscard]] Value get(std::string_view name) const;

  [[nodiscard]] bool has(std::string_view name) const;

  void setLocal(const std::string& name, Value value);

  /**
   * @brief Write to the global store
   *
   * Outside the entry file the write is dropped; the returned ScopeError is
   * also kept in diagnostics().
   */
  Result<void, ScriptError> setGlobal(const std::string& name, Value value);

  /**
   * @brief Replace every complete ${name} token with the display string of
   * get(name); an unterminated "${" is copied verbatim
   */
  [[nodiscard]] std::string interpolate(std::string_view text) const;

  [[nodiscard]] const VariableMap& locals() const { return m_locals; }
  [[nodiscard]] const VariableMap& globals() const { return m_globals; }

  // =========================================================================
  // Position
  // =========================================================================

  [[nodiscard]] const std::string& entryFile() const { return m_entryFile; }
  [[nodiscard]] const std::string& currentFile() const { return m_currentFile; }
  [[nodiscard]] const std::string& currentNode() const { return m_currentNode; }
  [[nodiscard]] bool isInEntryFile() const {
    return !m_entryFile.empty() && m_currentFile == m_entryFile;
  }

  void setCurrentNode(std::string node) { m_currentNode = std::move(node); }

  /// Last input line that matched an option
  [[nodiscard]] const std::string& lastInput() const { return m_lastInput; }
  void setLastInput(std::string input) { m_lastInput = std::move(input); }

  // =========================================================================
  // Diagnostics
  // =========================================================================

  [[nodiscard]] const ErrorList& diagnostics() const { return m_diagnostics; }

  /// Returns the recorded diagnostics and clears them
  ErrorList takeDiagnostics();

private:
  [[nodiscard]] static const Value* lookup(const VariableMap& store, std::string_view name);

  VariableMap m_globals;
  VariableMap m_locals;
  std::string m_entryFile;
  std::string m_currentFile;
  std::string m_currentNode;
  std::string m_lastInput;
  ErrorList m_diagnostics;
};

} // namespace Branchline::scripting
