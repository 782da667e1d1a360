#pragma once

/**
 * @file script_error.hpp
 * @brief Diagnostics shared by the parser, registry, navigator and validator
 *
 * Every problem the engine can report is a ScriptError carrying an ErrorCode.
 * Codes are grouped by category:
 * - 1xxx: Parse errors (fatal to loading the document)
 * - 2xxx: Reference errors (recoverable at the navigator via fallback)
 * - 3xxx: Scope errors (write dropped, warning surfaced)
 * - 4xxx: Runtime and validation diagnostics
 */

#include "Branchline/core/types.hpp"
#include <algorithm>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace Branchline::scripting {

// =============================================================================
// String Similarity Utilities
// =============================================================================

/**
 * @brief Levenshtein (edit) distance between two strings
 */
[[nodiscard]] inline usize levenshteinDistance(const std::string& s1, const std::string& s2) {
  const usize m = s1.size();
  const usize n = s2.size();

  if (m == 0)
    return n;
  if (n == 0)
    return m;

  std::vector<usize> prev(n + 1);
  std::vector<usize> curr(n + 1);

  for (usize j = 0; j <= n; ++j) {
    prev[j] = j;
  }

  for (usize i = 1; i <= m; ++i) {
    curr[0] = i;
    for (usize j = 1; j <= n; ++j) {
      usize cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }

  return prev[n];
}

/**
 * @brief Candidates within @p maxDistance edits of @p name, closest first
 *
 * Exact matches are excluded; they are not a "did you mean".
 */
[[nodiscard]] inline std::vector<std::string>
findSimilarStrings(const std::string& name, const std::vector<std::string>& candidates,
                   usize maxDistance = 2, usize maxResults = 3) {
  std::vector<std::pair<usize, std::string>> matches;

  for (const auto& candidate : candidates) {
    usize lenDiff = (name.size() > candidate.size()) ? (name.size() - candidate.size())
                                                     : (candidate.size() - name.size());
    if (lenDiff > maxDistance)
      continue;

    usize dist = levenshteinDistance(name, candidate);
    if (dist <= maxDistance && dist > 0) {
      matches.emplace_back(dist, candidate);
    }
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::string> result;
  for (usize i = 0; i < std::min(matches.size(), maxResults); ++i) {
    result.push_back(matches[i].second);
  }

  return result;
}

// =============================================================================
// Locations
// =============================================================================

/**
 * @brief 1-based line/column position in a script; line 0 means "unknown"
 */
struct SourceLocation {
  u32 line = 0;
  u32 column = 0;

  SourceLocation() = default;
  SourceLocation(u32 l, u32 c) : line(l), column(c) {}

  [[nodiscard]] bool isValid() const { return line > 0; }

  bool operator==(const SourceLocation&) const = default;
};

struct SourceSpan {
  SourceLocation start;
  SourceLocation end;

  SourceSpan() = default;
  SourceSpan(SourceLocation s, SourceLocation e) : start(s), end(e) {}
  explicit SourceSpan(SourceLocation loc) : start(loc), end(loc) {}
};

/**
 * @brief The error line plus @p contextLines around it, with a caret under
 * @p column
 */
[[nodiscard]] inline std::string extractSourceContext(const std::string& source, u32 line,
                                                      u32 column, u32 contextLines = 2) {
  if (source.empty() || line == 0)
    return "";

  std::vector<std::string> lines;
  std::istringstream stream(source);
  std::string lineStr;
  while (std::getline(stream, lineStr)) {
    if (!lineStr.empty() && lineStr.back() == '\r') {
      lineStr.pop_back();
    }
    lines.push_back(lineStr);
  }

  if (line > lines.size())
    return "";

  std::ostringstream result;

  u32 startLine = (line > contextLines) ? (line - contextLines) : 1;
  u32 endLine = std::min(static_cast<u32>(lines.size()), line + contextLines);
  usize width = std::to_string(endLine).size();

  for (u32 i = startLine; i <= endLine; ++i) {
    std::string lineNum = std::to_string(i);
    lineNum.insert(0, width - lineNum.size(), ' ');

    bool isErrorLine = (i == line);
    result << (isErrorLine ? " > " : "   ") << lineNum << " | " << lines[i - 1] << "\n";

    if (isErrorLine && column > 0) {
      const std::string& text = lines[i - 1];
      usize visual = 0;
      for (usize j = 0; j + 1 < column && j < text.size(); ++j) {
        visual += (text[j] == '\t') ? 4 : 1;
      }
      result << std::string(width + 3, ' ') << " | " << std::string(visual, ' ') << "^\n";
    }
  }

  return result.str();
}

// =============================================================================
// Codes and severities
// =============================================================================

enum class Severity : u8 {
  Hint,    // Suggestions for improvement
  Info,    // Informational messages
  Warning, // Recoverable problems; the session continues
  Error    // Problems that stop loading or halt the current step
};

[[nodiscard]] inline const char* severityToString(Severity sev) {
  switch (sev) {
  case Severity::Hint:
    return "hint";
  case Severity::Info:
    return "info";
  case Severity::Warning:
    return "warning";
  case Severity::Error:
    return "error";
  }
  return "unknown";
}

enum class ErrorCode : u32 {
  // Parse errors (1xxx)
  MissingMetadata = 1001,
  GlobalOutsideEntry = 1002,
  DuplicateVariable = 1003,
  InvalidNodeName = 1004,
  DuplicateNode = 1005,
  MalformedBranch = 1006,
  MalformedCall = 1007,
  MalformedDeclaration = 1008,
  InvalidDependency = 1009,
  ContentOutsideNode = 1010,

  // Reference errors (2xxx)
  UnknownNode = 2001,
  UnknownFile = 2002,
  MissingDependency = 2003,
  UnknownFunction = 2004,
  UndeclaredDependency = 2005,

  // Scope errors (3xxx)
  GlobalWriteOutsideEntry = 3001,

  // Runtime errors (40xx)
  FunctionFailed = 4001,
  TransitionLimitExceeded = 4002,
  FallbackUnresolved = 4003,
  SessionNotStarted = 4004,
  EntryFileConflict = 4005,

  // Validation diagnostics (41xx)
  DeadEndNode = 4101,
  UnreachableNode = 4102,
  MissingStartNode = 4103
};

enum class ErrorCategory : u8 { Parse, Reference, Scope, Runtime, Validation };

[[nodiscard]] inline ErrorCategory errorCategory(ErrorCode code) {
  const auto value = static_cast<u32>(code);
  if (value < 2000)
    return ErrorCategory::Parse;
  if (value < 3000)
    return ErrorCategory::Reference;
  if (value < 4000)
    return ErrorCategory::Scope;
  if (value < 4100)
    return ErrorCategory::Runtime;
  return ErrorCategory::Validation;
}

[[nodiscard]] inline const char* errorCategoryName(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::Parse:
    return "ParseError";
  case ErrorCategory::Reference:
    return "ReferenceError";
  case ErrorCategory::Scope:
    return "ScopeError";
  case ErrorCategory::Runtime:
    return "RuntimeError";
  case ErrorCategory::Validation:
    return "ValidationError";
  }
  return "Error";
}

[[nodiscard]] inline const char* errorCodeDescription(ErrorCode code) {
  switch (code) {
  case ErrorCode::MissingMetadata:
    return "Missing required metadata";
  case ErrorCode::GlobalOutsideEntry:
    return "Global variables declared outside the entry file";
  case ErrorCode::DuplicateVariable:
    return "Duplicate variable declaration";
  case ErrorCode::InvalidNodeName:
    return "Invalid node name";
  case ErrorCode::DuplicateNode:
    return "Duplicate node";
  case ErrorCode::MalformedBranch:
    return "Malformed branch";
  case ErrorCode::MalformedCall:
    return "Malformed function call";
  case ErrorCode::MalformedDeclaration:
    return "Malformed variable declaration";
  case ErrorCode::InvalidDependency:
    return "Invalid dependency";
  case ErrorCode::ContentOutsideNode:
    return "Content outside of a node";

  case ErrorCode::UnknownNode:
    return "Unknown node";
  case ErrorCode::UnknownFile:
    return "Unknown file";
  case ErrorCode::MissingDependency:
    return "Missing dependency";
  case ErrorCode::UnknownFunction:
    return "Unknown function";
  case ErrorCode::UndeclaredDependency:
    return "Transfer to an undeclared dependency";

  case ErrorCode::GlobalWriteOutsideEntry:
    return "Global write outside the entry file";

  case ErrorCode::FunctionFailed:
    return "Host function failed";
  case ErrorCode::TransitionLimitExceeded:
    return "Too many chained transitions";
  case ErrorCode::FallbackUnresolved:
    return "Fallback destination cannot be resolved";
  case ErrorCode::SessionNotStarted:
    return "Session not started";
  case ErrorCode::EntryFileConflict:
    return "Registry is bound to a different entry file";

  case ErrorCode::DeadEndNode:
    return "Node has no way out";
  case ErrorCode::UnreachableNode:
    return "Unreachable node";
  case ErrorCode::MissingStartNode:
    return "Missing start node";
  }
  return "Unknown error";
}

struct RelatedInformation {
  SourceLocation location;
  std::string message;

  RelatedInformation() = default;
  RelatedInformation(SourceLocation loc, std::string msg)
      : location(loc), message(std::move(msg)) {}
};

/**
 * @brief A single diagnostic
 *
 * Example output of format():
 *   error[E1005] at passwords.bdl:14:1: Node 'quiz' is already defined
 */
struct ScriptError {
  ErrorCode code = ErrorCode::MalformedDeclaration;
  Severity severity = Severity::Error;
  std::string message;
  SourceSpan span;

  std::optional<std::string> filePath;
  std::optional<std::string> source;
  std::vector<RelatedInformation> relatedInfo;
  std::vector<std::string> suggestions;

  ScriptError() = default;

  ScriptError(ErrorCode c, Severity sev, std::string msg, SourceLocation loc = {})
      : code(c), severity(sev), message(std::move(msg)), span(loc) {}

  ScriptError& withFilePath(std::string path) {
    filePath = std::move(path);
    return *this;
  }

  ScriptError& withRelated(SourceLocation loc, std::string msg) {
    relatedInfo.emplace_back(loc, std::move(msg));
    return *this;
  }

  ScriptError& withSuggestion(std::string suggestion) {
    suggestions.push_back(std::move(suggestion));
    return *this;
  }

  ScriptError& withSource(std::string src) {
    source = std::move(src);
    return *this;
  }

  [[nodiscard]] bool isError() const { return severity == Severity::Error; }
  [[nodiscard]] bool isWarning() const { return severity == Severity::Warning; }

  [[nodiscard]] ErrorCategory category() const { return errorCategory(code); }

  [[nodiscard]] std::string errorCodeString() const {
    return "E" + std::to_string(static_cast<u32>(code));
  }

  [[nodiscard]] std::string format() const {
    std::ostringstream ss;
    ss << severityToString(severity) << "[" << errorCodeString() << "]";

    if (filePath.has_value() || span.start.isValid()) {
      ss << " at ";
      if (filePath.has_value()) {
        ss << filePath.value();
        if (span.start.isValid()) {
          ss << ":";
        }
      }
      if (span.start.isValid()) {
        ss << span.start.line << ":" << span.start.column;
      }
    }

    ss << ": " << message;
    return ss.str();
  }

  [[nodiscard]] std::string formatRich() const {
    std::ostringstream ss;
    ss << format() << "\n";

    if (source.has_value() && !source->empty() && span.start.isValid()) {
      ss << "\n" << extractSourceContext(*source, span.start.line, span.start.column);
    }

    for (const auto& related : relatedInfo) {
      ss << "\n  note: " << related.message;
      if (related.location.isValid()) {
        ss << " (at line " << related.location.line << ":" << related.location.column << ")";
      }
    }

    if (!suggestions.empty()) {
      ss << "\n";
      if (suggestions.size() == 1) {
        ss << "  suggestion: " << suggestions[0] << "\n";
      } else {
        ss << "  suggestions:\n";
        for (usize i = 0; i < suggestions.size(); ++i) {
          ss << "    " << (i + 1) << ". " << suggestions[i] << "\n";
        }
      }
    }

    return ss.str();
  }
};

/**
 * @brief Collection of diagnostics with helper queries
 */
class ErrorList {
public:
  ScriptError& add(ScriptError error) { return m_errors.emplace_back(std::move(error)); }

  ScriptError& addError(ErrorCode code, std::string message, SourceLocation loc = {}) {
    return m_errors.emplace_back(code, Severity::Error, std::move(message), loc);
  }

  ScriptError& addWarning(ErrorCode code, std::string message, SourceLocation loc = {}) {
    return m_errors.emplace_back(code, Severity::Warning, std::move(message), loc);
  }

  ScriptError& addHint(ErrorCode code, std::string message, SourceLocation loc = {}) {
    return m_errors.emplace_back(code, Severity::Hint, std::move(message), loc);
  }

  void append(const ErrorList& other) {
    m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
  }

  [[nodiscard]] bool hasErrors() const {
    return std::any_of(m_errors.begin(), m_errors.end(),
                       [](const ScriptError& e) { return e.isError(); });
  }

  [[nodiscard]] bool hasWarnings() const {
    return std::any_of(m_errors.begin(), m_errors.end(),
                       [](const ScriptError& e) { return e.isWarning(); });
  }

  [[nodiscard]] bool contains(ErrorCode code) const {
    return std::any_of(m_errors.begin(), m_errors.end(),
                       [code](const ScriptError& e) { return e.code == code; });
  }

  [[nodiscard]] usize errorCount() const {
    return static_cast<usize>(std::count_if(m_errors.begin(), m_errors.end(),
                                            [](const ScriptError& e) { return e.isError(); }));
  }

  [[nodiscard]] usize warningCount() const {
    return static_cast<usize>(std::count_if(m_errors.begin(), m_errors.end(),
                                            [](const ScriptError& e) { return e.isWarning(); }));
  }

  /**
   * @brief First entry with Error severity, or nullptr
   */
  [[nodiscard]] const ScriptError* firstError() const {
    for (const auto& e : m_errors) {
      if (e.isError()) {
        return &e;
      }
    }
    return nullptr;
  }

  [[nodiscard]] const std::vector<ScriptError>& all() const { return m_errors; }

  void clear() { m_errors.clear(); }
  [[nodiscard]] bool empty() const { return m_errors.empty(); }
  [[nodiscard]] usize size() const { return m_errors.size(); }

private:
  std::vector<ScriptError> m_errors;
};

} // namespace Branchline::scripting
