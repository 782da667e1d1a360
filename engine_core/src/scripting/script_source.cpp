#include "Branchline/scripting/script_source.hpp"
#include "Branchline/scripting/document.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace Branchline::scripting {

namespace fs = std::filesystem;

// =============================================================================
// FileScriptSource
// =============================================================================

FileScriptSource::FileScriptSource(fs::path root) : m_root(std::move(root)) {}

Result<fs::path> FileScriptSource::resolvePath(const std::string& name) const {
  const fs::path relative(normalizeScriptName(name));
  if (relative.empty() || relative.is_absolute()) {
    return Result<fs::path>::error("Invalid script name: " + name);
  }
  for (const auto& part : relative) {
    if (part == "..") {
      return Result<fs::path>::error("Script name escapes the script directory: " + name);
    }
  }
  return Result<fs::path>::ok(m_root / relative);
}

Result<std::string> FileScriptSource::read(const std::string& name) const {
  auto path = resolvePath(name);
  if (path.isError()) {
    return Result<std::string>::error(path.error());
  }

  std::ifstream file(path.value(), std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::error("Cannot open script: " + path.value().string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::error("Failed to read script: " + path.value().string());
  }
  return Result<std::string>::ok(buffer.str());
}

bool FileScriptSource::exists(const std::string& name) const {
  auto path = resolvePath(name);
  if (path.isError()) {
    return false;
  }
  std::error_code ec;
  return fs::is_regular_file(path.value(), ec);
}

std::vector<std::string> FileScriptSource::list() const {
  std::vector<std::string> names;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == SCRIPT_EXTENSION) {
      names.push_back(fs::relative(it->path(), m_root, ec).generic_string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

// =============================================================================
// MemoryScriptSource
// =============================================================================

void MemoryScriptSource::add(const std::string& name, std::string text) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_scripts[normalizeScriptName(name)] = std::move(text);
}

Result<std::string> MemoryScriptSource::read(const std::string& name) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_scripts.find(normalizeScriptName(name));
  if (it == m_scripts.end()) {
    return Result<std::string>::error("No such script: " + name);
  }
  return Result<std::string>::ok(it->second);
}

bool MemoryScriptSource::exists(const std::string& name) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_scripts.count(normalizeScriptName(name)) > 0;
}

std::vector<std::string> MemoryScriptSource::list() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> names;
  names.reserve(m_scripts.size());
  for (const auto& [name, text] : m_scripts) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace Branchline::scripting
