#pragma once

/**
 * @file parser.hpp
 * @brief Line-oriented parser for BDL scripts
 *
 * Grammar summary (one construct per line, blank lines and '#' lines are
 * skipped everywhere except that a leading run of "# Key: value" lines forms
 * the metadata header):
 *
 * @code
 * # Topic: Password Security
 * # Description: ...
 * # Author: ...
 * # Version: 1.0
 * # Required: passwords.bdl
 *
 * $global_vars: {
 *     user_name: "",
 *     completed_modules: {}
 * }
 *
 * @start
 * Welcome, ${user_name}!
 * !{getUserInput} : ~{input}
 * {password, passwords} -> [passwords.bdl:start]
 * ?{finished} -> {exit}
 * -> ${next}
 * @endcode
 */

#include "Branchline/core/result.hpp"
#include "Branchline/scripting/document.hpp"
#include "Branchline/scripting/script_error.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Branchline::scripting {

class Parser {
public:
  Parser();
  ~Parser();

  /**
   * @brief Parse one script
   * @param source Raw script text
   * @param fileName File identifier; normalized to carry the .bdl extension
   * @param isEntryFile Only the entry file may declare $global_vars
   * @return The document, or the first error (all diagnostics, including
   *         warnings, remain available through getErrors())
   */
  [[nodiscard]] Result<Document, ScriptError> parse(std::string_view source,
                                                    const std::string& fileName, bool isEntryFile);

  [[nodiscard]] const ErrorList& getErrors() const { return m_errors; }

private:
  struct Line {
    std::string text; ///< Trimmed
    u32 number = 0;
    u32 column = 1; ///< Column of the first non-blank character
  };

  enum class Scope { Local, Global };

  void reset();
  void splitLines(std::string_view source);

  void parseMetadataLine(const Line& line);
  void validateMetadata();
  void parseRequiredList(const std::string& value, const Line& line);

  usize parseDeclarationBlock(usize index, Scope scope, usize prefixLength);

  void startNode(const Line& line);
  void finishNode();
  void flushText();

  void parseCall(const Line& line);
  void parseBranch(const Line& line);
  [[nodiscard]] std::optional<Destination> parseDestination(std::string_view text,
                                                            const Line& line);

  ScriptError& report(ErrorCode code, std::string message, SourceLocation loc);
  ScriptError& warn(ErrorCode code, std::string message, SourceLocation loc);

  std::string m_fileName;
  bool m_isEntry = false;
  std::vector<Line> m_lines;
  Document m_document;
  ErrorList m_errors;

  std::optional<Node> m_currentNode;
  bool m_discardCurrentNode = false;
  std::vector<std::string> m_pendingText;
  SourceLocation m_pendingTextLocation;

  bool m_seenTopic = false;
  bool m_seenDescription = false;
  bool m_seenAuthor = false;
  bool m_seenVersion = false;
  bool m_seenGlobalBlock = false;
};

} // namespace Branchline::scripting
