#pragma once

/**
 * @file document.hpp
 * @brief Parsed form of one BDL script file
 *
 * A Document is produced once by the Parser, cached by the DocumentRegistry
 * and never mutated afterwards. Sessions only ever hold const references to
 * it, so one Document can back any number of concurrent sessions.
 */

#include "Branchline/core/types.hpp"
#include "Branchline/scripting/script_error.hpp"
#include "Branchline/scripting/value.hpp"
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Branchline::scripting {

/// File extension of BDL scripts; names without an extension get it appended
inline constexpr std::string_view SCRIPT_EXTENSION = ".bdl";

/// Keyword that matches any non-empty input line
inline constexpr std::string_view WILDCARD_KEYWORD = "*";

struct Metadata {
  std::string topic;
  std::string description;
  std::string author;
  std::string version;
  std::vector<std::string> required; ///< Normalized file names, declaration order

  bool operator==(const Metadata&) const = default;
};

// =============================================================================
// Content
// =============================================================================

/**
 * @brief One or more consecutive text lines, joined with '\n'
 *
 * May contain ${name} tokens, resolved at render time.
 */
struct TextElement {
  std::string text;
  SourceLocation location;

  bool operator==(const TextElement&) const = default;
};

/**
 * @brief `!{function} : ~{a} ~{b}` - host call whose results bind to a, b
 */
struct CallElement {
  std::string function;
  std::vector<std::string> bindings;
  SourceLocation location;

  bool operator==(const CallElement&) const = default;
};

using ContentElement = std::variant<TextElement, CallElement>;

// =============================================================================
// Destinations
// =============================================================================

struct NodeTarget {
  std::string node;

  bool operator==(const NodeTarget&) const = default;
};

/**
 * @brief `[file:node]`; either side may contain ${name} tokens
 */
struct FileTransferTarget {
  std::string file;
  std::string node;

  [[nodiscard]] bool isInterpolated() const;

  bool operator==(const FileTransferTarget&) const = default;
};

struct ExitTarget {
  bool operator==(const ExitTarget&) const = default;
};

/**
 * @brief `${variable}`: the destination is read from a variable at run time
 */
struct DynamicTarget {
  std::string variable;

  bool operator==(const DynamicTarget&) const = default;
};

using Destination = std::variant<NodeTarget, FileTransferTarget, ExitTarget, DynamicTarget>;

// =============================================================================
// Branches
// =============================================================================

/**
 * @brief `{kw1, kw2} -> dest`; keywords are trimmed and lower-cased
 */
struct OptionBranch {
  std::set<std::string> keywords;
  Destination destination;
  SourceLocation location;

  [[nodiscard]] bool matches(std::string_view normalizedInput) const;

  bool operator==(const OptionBranch&) const = default;
};

/**
 * @brief `?{variable} -> dest`; taken during rendering when the variable is truthy
 */
struct ConditionBranch {
  std::string variable;
  Destination destination;
  SourceLocation location;

  bool operator==(const ConditionBranch&) const = default;
};

/**
 * @brief `-> dest`; taken unconditionally when reached during rendering
 */
struct GotoBranch {
  Destination destination;
  SourceLocation location;

  bool operator==(const GotoBranch&) const = default;
};

using Branch = std::variant<OptionBranch, ConditionBranch, GotoBranch>;

[[nodiscard]] const Destination& branchDestination(const Branch& branch);

// =============================================================================
// Nodes and documents
// =============================================================================

struct Node {
  std::string name;
  std::vector<ContentElement> content;
  std::vector<Branch> branches; ///< Source order
  SourceLocation location;

  [[nodiscard]] bool hasOptions() const;

  bool operator==(const Node&) const = default;
};

struct Document {
  std::string name;
  Metadata metadata;
  bool declaresGlobal = false;
  VariableMap localDefaults;
  VariableMap globalDefaults;
  std::unordered_map<std::string, Node> nodes;
  std::vector<std::string> nodeOrder; ///< Node names in declaration order

  [[nodiscard]] const Node* findNode(std::string_view nodeName) const;
  [[nodiscard]] bool dependsOn(std::string_view fileName) const;

  bool operator==(const Document&) const = default;
};

// =============================================================================
// Helpers
// =============================================================================

/**
 * @brief Trim whitespace and append ".bdl" when the name has no extension
 */
[[nodiscard]] std::string normalizeScriptName(std::string_view name);

/**
 * @brief True for names matching [A-Za-z0-9_]+
 */
[[nodiscard]] bool isValidNodeName(std::string_view name);

/**
 * @brief Input normalization used for option matching: trim + lower-case
 */
[[nodiscard]] std::string normalizeInput(std::string_view input);

[[nodiscard]] bool containsInterpolation(std::string_view text);

/**
 * @brief Script-like rendering of a destination ("intro", "[a.bdl:start]",
 * "{exit}", "${next}")
 */
[[nodiscard]] std::string describeDestination(const Destination& destination);

} // namespace Branchline::scripting
