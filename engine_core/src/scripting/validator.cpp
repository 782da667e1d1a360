#include "Branchline/scripting/validator.hpp"
#include "Branchline/core/logger.hpp"
#include <deque>

namespace Branchline::scripting {

ValidationResult Validator::validate(DocumentRegistry& registry) {
  m_result = ValidationResult{};

  // Transfers may load further documents; keep going until nothing new appears
  std::vector<std::string> names = registry.loadedDocuments();
  std::set<std::string> checked;
  for (usize i = 0; i < names.size(); ++i) {
    if (!checked.insert(names[i]).second) {
      continue;
    }
    if (const Document* document = registry.find(names[i])) {
      validateDocument(registry, *document);
      ++m_result.documentsChecked;
    }
    if (i + 1 == names.size()) {
      for (const auto& name : registry.loadedDocuments()) {
        if (checked.count(name) == 0) {
          names.push_back(name);
        }
      }
    }
  }

  if (m_reportUnreachable) {
    checkReachability(registry);
  }

  m_result.isValid = !m_result.errors.hasErrors();
  BRANCHLINE_LOG_INFO("Validated {} document(s): {} error(s), {} warning(s)",
                      m_result.documentsChecked, m_result.errors.errorCount(),
                      m_result.errors.warningCount());
  return std::move(m_result);
}

ScriptError& Validator::report(ErrorCode code, Severity severity, std::string message,
                               const Document& document, SourceLocation location) {
  ScriptError error(code, severity, std::move(message), location);
  error.withFilePath(document.name);
  return m_result.errors.add(std::move(error));
}

void Validator::validateDocument(DocumentRegistry& registry, const Document& document) {
  if (document.name == registry.entryFile() && !document.findNode(m_startNode)) {
    report(ErrorCode::MissingStartNode, Severity::Error,
           "Entry file has no '@" + m_startNode + "' node", document, {1, 1});
  }

  for (const auto& nodeName : document.nodeOrder) {
    const Node* node = document.findNode(nodeName);
    if (!node) {
      continue;
    }

    if (m_dispatcher) {
      for (const auto& element : node->content) {
        const auto* call = std::get_if<CallElement>(&element);
        if (!call || m_dispatcher->hasFunction(call->function)) {
          continue;
        }
        auto& warning = report(ErrorCode::UnknownFunction, Severity::Warning,
                               "Unknown function '" + call->function + "'", document,
                               call->location);
        for (const auto& candidate :
             findSimilarStrings(call->function, m_dispatcher->functionNames())) {
          warning.withSuggestion("Did you mean '" + candidate + "'?");
        }
      }
    }

    bool hasExit = false;
    for (const auto& branch : node->branches) {
      if (std::holds_alternative<OptionBranch>(branch) ||
          std::holds_alternative<GotoBranch>(branch)) {
        hasExit = true;
      }
      const SourceLocation location =
          std::visit([](const auto& b) { return b.location; }, branch);
      validateDestination(registry, document, *node, branchDestination(branch), location);
    }

    if (!hasExit) {
      report(ErrorCode::DeadEndNode, Severity::Warning,
             "Node '" + node->name + "' has no options and no unconditional transition",
             document, node->location);
    }
  }
}

void Validator::validateDestination(DocumentRegistry& registry, const Document& document,
                                    const Node& node, const Destination& destination,
                                    SourceLocation location) {
  if (std::holds_alternative<ExitTarget>(destination)) {
    return;
  }
  if (std::holds_alternative<DynamicTarget>(destination)) {
    ++m_result.dynamicDestinations;
    return;
  }

  if (const auto* target = std::get_if<NodeTarget>(&destination)) {
    if (document.findNode(target->node)) {
      return;
    }
    auto& error = report(ErrorCode::UnknownNode, Severity::Error,
                         "Node '" + node.name + "' goes to unknown node '" + target->node + "'",
                         document, location);
    for (const auto& candidate : findSimilarStrings(target->node, document.nodeOrder)) {
      error.withSuggestion("Did you mean '" + candidate + "'?");
    }
    return;
  }

  const auto& transfer = std::get<FileTransferTarget>(destination);
  if (transfer.isInterpolated()) {
    ++m_result.dynamicDestinations;
    return;
  }

  if (transfer.file != document.name && !document.dependsOn(transfer.file)) {
    report(ErrorCode::UndeclaredDependency, Severity::Warning,
           "Transfer to " + transfer.file + " which is not listed in '# Required:'", document,
           location)
        .withSuggestion("Add '" + transfer.file + "' to the Required header");
  }

  auto loaded = registry.load(transfer.file);
  if (loaded.isError()) {
    auto& error = report(ErrorCode::UnknownFile, Severity::Error,
                         "Transfer target " + transfer.file +
                             " cannot be loaded: " + loaded.error().message,
                         document, location);
    for (const auto& suggestion : loaded.error().suggestions) {
      error.withSuggestion(suggestion);
    }
    return;
  }

  const Document* target = loaded.value();
  if (!target->findNode(transfer.node)) {
    auto& error = report(ErrorCode::UnknownNode, Severity::Error,
                         "Node '" + transfer.node + "' does not exist in " + target->name,
                         document, location);
    for (const auto& candidate : findSimilarStrings(transfer.node, target->nodeOrder)) {
      error.withSuggestion("Did you mean '" + candidate + "'?");
    }
  }
}

void Validator::checkReachability(DocumentRegistry& registry) {
  const std::string entry = registry.entryFile();
  const Document* entryDocument = entry.empty() ? nullptr : registry.find(entry);
  if (!entryDocument || !entryDocument->findNode(m_startNode)) {
    return;
  }

  std::set<NodeKey> visited;
  std::deque<NodeKey> queue;
  queue.emplace_back(entry, m_startNode);
  visited.insert(queue.front());

  while (!queue.empty()) {
    const NodeKey current = queue.front();
    queue.pop_front();

    const Document* document = registry.find(current.first);
    const Node* node = document ? document->findNode(current.second) : nullptr;
    if (!node) {
      continue;
    }

    for (const auto& branch : node->branches) {
      const Destination& destination = branchDestination(branch);
      NodeKey next;
      if (const auto* target = std::get_if<NodeTarget>(&destination)) {
        next = {current.first, target->node};
      } else if (const auto* transfer = std::get_if<FileTransferTarget>(&destination)) {
        if (transfer->isInterpolated()) {
          continue;
        }
        next = {transfer->file, transfer->node};
      } else {
        continue;
      }
      if (visited.insert(next).second) {
        queue.push_back(std::move(next));
      }
    }
  }

  for (const auto& name : registry.loadedDocuments()) {
    const Document* document = registry.find(name);
    if (!document) {
      continue;
    }
    for (const auto& nodeName : document->nodeOrder) {
      if (visited.count({name, nodeName}) > 0) {
        continue;
      }
      const Node* node = document->findNode(nodeName);
      m_result.errors
          .addHint(ErrorCode::UnreachableNode,
                   "Node '" + nodeName + "' is not reachable from " + entry + ":" + m_startNode +
                       " through literal destinations",
                   node ? node->location : SourceLocation{})
          .withFilePath(name);
    }
  }
}

} // namespace Branchline::scripting
