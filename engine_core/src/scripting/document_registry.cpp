#include "Branchline/scripting/document_registry.hpp"
#include "Branchline/core/logger.hpp"
#include "Branchline/scripting/parser.hpp"

namespace Branchline::scripting {

using DocumentResult = Result<const Document*, ScriptError>;

DocumentRegistry::DocumentRegistry(std::shared_ptr<const IScriptSource> source)
    : m_source(std::move(source)) {}

DocumentRegistry::~DocumentRegistry() = default;

DocumentResult DocumentRegistry::loadEntry(const std::string& fileName) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  const std::string name = normalizeScriptName(fileName);

  if (!m_entryFile.empty() && m_entryFile != name) {
    ScriptError error(ErrorCode::EntryFileConflict, Severity::Error,
                      "Cannot use " + name + " as entry file; this registry was started from " +
                          m_entryFile);
    return DocumentResult::error(std::move(error));
  }
  if (m_entryFile.empty() && m_entries.count(name) > 0) {
    ScriptError error(ErrorCode::EntryFileConflict, Severity::Error,
                      name + " was already loaded as a dependency and cannot become the entry file");
    return DocumentResult::error(std::move(error));
  }

  m_entryFile = name;
  return loadLocked(name);
}

DocumentResult DocumentRegistry::load(const std::string& fileName) {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return loadLocked(normalizeScriptName(fileName));
}

DocumentResult DocumentRegistry::loadLocked(const std::string& name) {
  const bool outermost = m_loadDepth == 0;
  ++m_loadDepth;
  auto result = loadOne(name);
  --m_loadDepth;

  if (outermost) {
    if (result.isError()) {
      // Files registered during a failed load may depend on the file that failed
      for (const auto& inserted : m_insertedThisLoad) {
        m_entries.erase(inserted);
        std::erase(m_loadOrder, inserted);
      }
    }
    m_insertedThisLoad.clear();
  }
  return result;
}

DocumentResult DocumentRegistry::loadOne(const std::string& name) {
  auto it = m_entries.find(name);
  if (it != m_entries.end()) {
    // Either complete, or still loading further up a dependency cycle
    return DocumentResult::ok(&it->second->document);
  }

  if (!m_source->exists(name)) {
    ScriptError error(ErrorCode::UnknownFile, Severity::Error, "Script '" + name + "' not found");
    for (const auto& candidate : findSimilarStrings(name, m_source->list())) {
      error.withSuggestion("Did you mean '" + candidate + "'?");
    }
    return DocumentResult::error(std::move(error));
  }

  auto text = m_source->read(name);
  if (text.isError()) {
    ScriptError error(ErrorCode::UnknownFile, Severity::Error, text.error());
    error.withFilePath(name);
    return DocumentResult::error(std::move(error));
  }

  Parser parser;
  auto parsed = parser.parse(text.value(), name, name == m_entryFile);
  for (const auto& diagnostic : parser.getErrors().all()) {
    if (!diagnostic.isError()) {
      m_diagnostics.add(diagnostic);
    }
  }
  if (parsed.isError()) {
    BRANCHLINE_LOG_ERROR("Failed to load {}: {}", name, parsed.error().format());
    return DocumentResult::error(parsed.error());
  }

  auto entry = std::make_unique<Entry>();
  entry->document = std::move(parsed).value();
  Entry* loaded = entry.get();
  m_entries.emplace(name, std::move(entry));
  m_insertedThisLoad.push_back(name);

  for (const auto& dependency : loaded->document.metadata.required) {
    BRANCHLINE_LOG_DEBUG("{} requires {}", name, dependency);
    auto result = loadLocked(dependency);
    if (result.isError()) {
      ScriptError error(ErrorCode::MissingDependency, Severity::Error,
                        "Required file '" + dependency +
                            "' could not be loaded: " + result.error().message);
      error.withFilePath(name);
      for (const auto& suggestion : result.error().suggestions) {
        error.withSuggestion(suggestion);
      }
      return DocumentResult::error(std::move(error));
    }
  }

  loaded->complete = true;
  m_loadOrder.push_back(name);
  BRANCHLINE_LOG_INFO("Loaded {} ({} node(s), {} dependency(ies))", name,
                      loaded->document.nodes.size(), loaded->document.metadata.required.size());
  return DocumentResult::ok(&loaded->document);
}

Result<const Node*, ScriptError> DocumentRegistry::resolve(const std::string& fileName,
                                                           const std::string& nodeName) {
  auto document = load(fileName);
  if (document.isError()) {
    const ScriptError& cause = document.error();
    if (cause.category() != ErrorCategory::Parse) {
      return Result<const Node*, ScriptError>::error(cause);
    }
    const std::string name = normalizeScriptName(fileName);
    ScriptError error(ErrorCode::UnknownFile, Severity::Error,
                      "Script '" + name + "' could not be parsed");
    error.withFilePath(name);
    error.withRelated(cause.span.start, cause.format());
    return Result<const Node*, ScriptError>::error(std::move(error));
  }

  const Document* doc = document.value();
  if (const Node* node = doc->findNode(nodeName)) {
    return Result<const Node*, ScriptError>::ok(node);
  }

  ScriptError error(ErrorCode::UnknownNode, Severity::Error,
                    "Node '" + nodeName + "' does not exist in " + doc->name);
  error.withFilePath(doc->name);
  for (const auto& candidate : findSimilarStrings(nodeName, doc->nodeOrder)) {
    error.withSuggestion("Did you mean '" + candidate + "'?");
  }
  return Result<const Node*, ScriptError>::error(std::move(error));
}

const Document* DocumentRegistry::find(const std::string& fileName) const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  auto it = m_entries.find(normalizeScriptName(fileName));
  return it != m_entries.end() ? &it->second->document : nullptr;
}

bool DocumentRegistry::isLoaded(const std::string& fileName) const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  auto it = m_entries.find(normalizeScriptName(fileName));
  return it != m_entries.end() && it->second->complete;
}

std::vector<std::string> DocumentRegistry::loadedDocuments() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_loadOrder;
}

std::string DocumentRegistry::entryFile() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_entryFile;
}

ErrorList DocumentRegistry::diagnostics() const {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  return m_diagnostics;
}

void DocumentRegistry::clear() {
  std::lock_guard<std::recursive_mutex> lock(m_mutex);
  m_entries.clear();
  m_loadOrder.clear();
  m_entryFile.clear();
  m_diagnostics.clear();
}

} // namespace Branchline::scripting
