#pragma once

/**
 * @file validator.hpp
 * @brief Static checks over loaded documents
 *
 * The validator walks every document in a registry and reports:
 * - literal node destinations that do not exist
 * - literal file transfers to files that cannot be loaded, to nodes missing
 *   in the target, or to files not listed in "# Required:"
 * - calls to functions unknown to a dispatcher (when one is supplied)
 * - nodes with no way out
 * - nodes unreachable from the entry start node
 *
 * Destinations computed at run time (${var}, [${file}:${node}]) cannot be
 * checked. Nodes only reached through such destinations are reported as
 * unreachable hints; the check is incomplete by nature.
 */

#include "Branchline/scripting/document_registry.hpp"
#include "Branchline/scripting/function_dispatcher.hpp"
#include "Branchline/scripting/script_error.hpp"
#include <set>
#include <string>
#include <utility>

namespace Branchline::scripting {

struct ValidationResult {
  ErrorList errors;
  bool isValid = true;
  usize documentsChecked = 0;
  usize dynamicDestinations = 0; ///< Destinations skipped because they are computed at run time

  [[nodiscard]] bool hasErrors() const { return errors.hasErrors(); }
  [[nodiscard]] bool hasWarnings() const { return errors.hasWarnings(); }
};

class Validator {
public:
  Validator() = default;

  /// Check calls against @p dispatcher; nullptr disables the check
  void setFunctionDispatcher(const FunctionDispatcher* dispatcher) { m_dispatcher = dispatcher; }

  void setStartNode(std::string node) { m_startNode = std::move(node); }

  void setReportUnreachable(bool enabled) { m_reportUnreachable = enabled; }

  /**
   * @brief Validate every loaded document
   *
   * Literal transfer targets that are not loaded yet are loaded through the
   * registry, so the registry may grow.
   */
  [[nodiscard]] ValidationResult validate(DocumentRegistry& registry);

private:
  using NodeKey = std::pair<std::string, std::string>; // file, node

  void validateDocument(DocumentRegistry& registry, const Document& document);
  void validateDestination(DocumentRegistry& registry, const Document& document,
                           const Node& node, const Destination& destination,
                           SourceLocation location);
  void checkReachability(DocumentRegistry& registry);

  ScriptError& report(ErrorCode code, Severity severity, std::string message,
                      const Document& document, SourceLocation location);

  const FunctionDispatcher* m_dispatcher = nullptr;
  std::string m_startNode = "start";
  bool m_reportUnreachable = true;

  ValidationResult m_result;
};

} // namespace Branchline::scripting
