#pragma once

/**
 * @file script_source.hpp
 * @brief Where script text comes from
 *
 * The registry only ever asks a source for the text of a named script. File
 * names passed in are already normalized (they carry the .bdl extension).
 */

#include "Branchline/core/result.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Branchline::scripting {

class IScriptSource {
public:
  virtual ~IScriptSource() = default;

  [[nodiscard]] virtual Result<std::string> read(const std::string& name) const = 0;
  [[nodiscard]] virtual bool exists(const std::string& name) const = 0;

  /// Names of every script this source can provide, sorted
  [[nodiscard]] virtual std::vector<std::string> list() const = 0;
};

/**
 * @brief Scripts stored as files below one root directory
 *
 * Names are resolved relative to the root; names that would escape it
 * ("../secret.bdl", absolute paths) are rejected.
 */
class FileScriptSource : public IScriptSource {
public:
  explicit FileScriptSource(std::filesystem::path root);

  [[nodiscard]] Result<std::string> read(const std::string& name) const override;
  [[nodiscard]] bool exists(const std::string& name) const override;
  [[nodiscard]] std::vector<std::string> list() const override;

  [[nodiscard]] const std::filesystem::path& root() const { return m_root; }

private:
  [[nodiscard]] Result<std::filesystem::path> resolvePath(const std::string& name) const;

  std::filesystem::path m_root;
};

/**
 * @brief Scripts held in memory; used by tests and embedding hosts
 */
class MemoryScriptSource : public IScriptSource {
public:
  MemoryScriptSource() = default;

  /// Add or replace a script; the name is normalized
  void add(const std::string& name, std::string text);

  [[nodiscard]] Result<std::string> read(const std::string& name) const override;
  [[nodiscard]] bool exists(const std::string& name) const override;
  [[nodiscard]] std::vector<std::string> list() const override;

private:
  mutable std::mutex m_mutex;
  std::unordered_map<std::string, std::string> m_scripts;
};

} // namespace Branchline::scripting
