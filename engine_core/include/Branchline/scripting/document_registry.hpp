#pragma once

/**
 * @file document_registry.hpp
 * @brief Loads, caches and resolves documents by file name
 *
 * Loading a document loads everything listed in its "# Required:" header,
 * eagerly and recursively. Cyclic requirements are allowed: when a file that
 * is still being loaded is requested again, the already registered document
 * is returned even though its own requirements may not be loaded yet.
 *
 * Loads are serialized by one lock. Once loaded a document never changes and
 * the pointers handed out stay valid until clear() or destruction, so any
 * number of sessions can share one registry.
 */

#include "Branchline/core/result.hpp"
#include "Branchline/scripting/document.hpp"
#include "Branchline/scripting/script_error.hpp"
#include "Branchline/scripting/script_source.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Branchline::scripting {

class DocumentRegistry {
public:
  explicit DocumentRegistry(std::shared_ptr<const IScriptSource> source);
  ~DocumentRegistry();

  DocumentRegistry(const DocumentRegistry&) = delete;
  DocumentRegistry& operator=(const DocumentRegistry&) = delete;

  /**
   * @brief Load the entry file; the only file allowed to declare globals
   *
   * Must be called before any other file that should be treated as the entry
   * is loaded. Calling it again with a different name fails.
   */
  Result<const Document*, ScriptError> loadEntry(const std::string& fileName);

  /**
   * @brief Load (or return the cached) document and its requirements
   *
   * Fails with the parse error of the file, UnknownFile when the source has
   * no such script, or MissingDependency when a required file fails to load.
   * A failed load leaves nothing behind: every file registered during the
   * attempt is dropped again.
   */
  Result<const Document*, ScriptError> load(const std::string& fileName);

  /**
   * @brief Look up a node, loading the file on demand
   *
   * A file that exists but does not parse is reported as UnknownFile, with
   * the parse error attached as a note.
   */
  Result<const Node*, ScriptError> resolve(const std::string& fileName,
                                           const std::string& nodeName);

  /// Cached document or nullptr; never triggers a load
  [[nodiscard]] const Document* find(const std::string& fileName) const;

  [[nodiscard]] bool isLoaded(const std::string& fileName) const;

  /// Names of all completely loaded documents, in load order
  [[nodiscard]] std::vector<std::string> loadedDocuments() const;

  [[nodiscard]] std::string entryFile() const;

  [[nodiscard]] const IScriptSource& source() const { return *m_source; }

  /// Parser warnings collected from every load
  [[nodiscard]] ErrorList diagnostics() const;

  void clear();

private:
  struct Entry {
    Document document;
    bool complete = false;
  };

  Result<const Document*, ScriptError> loadLocked(const std::string& name);
  Result<const Document*, ScriptError> loadOne(const std::string& name);

  std::shared_ptr<const IScriptSource> m_source;
  mutable std::recursive_mutex m_mutex;
  std::unordered_map<std::string, std::unique_ptr<Entry>> m_entries;
  std::vector<std::string> m_loadOrder;
  std::string m_entryFile;
  ErrorList m_diagnostics;
  std::vector<std::string> m_insertedThisLoad;
  i32 m_loadDepth = 0;
};

} // namespace Branchline::scripting
