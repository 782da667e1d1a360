#include "Branchline/scripting/document.hpp"
#include <algorithm>
#include <cctype>

namespace Branchline::scripting {

namespace {
inline bool safeIsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline bool safeIsAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

std::string_view trimView(std::string_view s) {
  while (!s.empty() && safeIsSpace(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && safeIsSpace(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}
} // namespace

bool FileTransferTarget::isInterpolated() const {
  return containsInterpolation(file) || containsInterpolation(node);
}

bool OptionBranch::matches(std::string_view normalizedInput) const {
  if (normalizedInput.empty()) {
    return false;
  }
  if (keywords.count(std::string(WILDCARD_KEYWORD)) > 0) {
    return true;
  }
  return keywords.count(std::string(normalizedInput)) > 0;
}

const Destination& branchDestination(const Branch& branch) {
  return std::visit([](const auto& b) -> const Destination& { return b.destination; }, branch);
}

bool Node::hasOptions() const {
  return std::any_of(branches.begin(), branches.end(), [](const Branch& b) {
    return std::holds_alternative<OptionBranch>(b);
  });
}

const Node* Document::findNode(std::string_view nodeName) const {
  auto it = nodes.find(std::string(nodeName));
  return it != nodes.end() ? &it->second : nullptr;
}

bool Document::dependsOn(std::string_view fileName) const {
  const std::string normalized = normalizeScriptName(fileName);
  return std::find(metadata.required.begin(), metadata.required.end(), normalized) !=
         metadata.required.end();
}

std::string normalizeScriptName(std::string_view name) {
  std::string result(trimView(name));
  if (result.empty()) {
    return result;
  }
  const auto slash = result.find_last_of("/\\");
  const auto dot = result.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    result += SCRIPT_EXTENSION;
  }
  return result;
}

bool isValidNodeName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) { return safeIsAlnum(c) || c == '_'; });
}

std::string normalizeInput(std::string_view input) {
  std::string result(trimView(input));
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

bool containsInterpolation(std::string_view text) {
  const auto open = text.find("${");
  return open != std::string_view::npos && text.find('}', open + 2) != std::string_view::npos;
}

std::string describeDestination(const Destination& destination) {
  struct Describer {
    std::string operator()(const NodeTarget& t) const { return t.node; }
    std::string operator()(const FileTransferTarget& t) const {
      return "[" + t.file + ":" + t.node + "]";
    }
    std::string operator()(const ExitTarget&) const { return "{exit}"; }
    std::string operator()(const DynamicTarget& t) const { return "${" + t.variable + "}"; }
  };
  return std::visit(Describer{}, destination);
}

} // namespace Branchline::scripting
