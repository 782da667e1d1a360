#include "Branchline/scripting/parser.hpp"
#include "Branchline/core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>

namespace Branchline::scripting {

namespace {

inline bool safeIsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

inline bool safeIsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

inline bool isIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string trim(std::string_view s) {
  while (!s.empty() && safeIsSpace(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && safeIsSpace(s.back())) {
    s.remove_suffix(1);
  }
  return std::string(s);
}

std::string toLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool startsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

/// Variable references may walk into maps: "progress.passwords"
bool isValidVariablePath(std::string_view path) {
  if (path.empty() || path.front() == '.' || path.back() == '.') {
    return false;
  }
  return std::all_of(path.begin(), path.end(),
                     [](char c) { return isIdentifierChar(c) || c == '.'; });
}

constexpr std::string_view GLOBAL_VARS = "$global_vars";
constexpr std::string_view LOCAL_VARS = "$local_vars";

/**
 * Recursive-descent reader for the body of a $global_vars / $local_vars
 * block. The text starts at the opening brace; line numbers are recovered by
 * counting newlines from the block's first line.
 */
class DeclarationReader {
public:
  struct Failure {
    ErrorCode code;
    std::string message;
    u32 line;
  };

  DeclarationReader(std::string_view text, u32 firstLine) : m_text(text), m_firstLine(firstLine) {}

  std::optional<std::vector<Value::Entry>> readMap(std::vector<u32>* keyLines = nullptr) {
    skipWhitespace();
    if (peek() != '{') {
      fail(ErrorCode::MalformedDeclaration, "Expected '{' to open a declaration block");
      return std::nullopt;
    }
    ++m_pos;

    std::vector<Value::Entry> entries;
    std::set<std::string> seen;

    while (true) {
      skipWhitespace();
      while (peek() == ',') {
        ++m_pos;
        skipWhitespace();
      }

      if (atEnd()) {
        fail(ErrorCode::MalformedDeclaration, "Unterminated block, expected '}'");
        return std::nullopt;
      }
      if (peek() == '}') {
        ++m_pos;
        return entries;
      }

      const u32 keyLine = currentLine();
      auto key = readKey();
      if (!key) {
        return std::nullopt;
      }

      skipSpaces();
      if (peek() != ':') {
        fail(ErrorCode::MalformedDeclaration, "Expected ':' after '" + *key + "'");
        return std::nullopt;
      }
      ++m_pos;
      skipSpaces();

      auto value = readValue();
      if (!value) {
        return std::nullopt;
      }

      if (!seen.insert(*key).second) {
        m_failure = Failure{ErrorCode::DuplicateVariable,
                            "Variable '" + *key + "' is declared more than once", keyLine};
        return std::nullopt;
      }
      entries.emplace_back(std::move(*key), std::move(*value));
      if (keyLines) {
        keyLines->push_back(keyLine);
      }

      skipSpaces();
      const char c = peek();
      if (!(atEnd() || c == ',' || c == '}' || c == '\n')) {
        fail(ErrorCode::MalformedDeclaration,
             "Expected ',' or '}' after the value of '" + entries.back().first + "'");
        return std::nullopt;
      }
    }
  }

  [[nodiscard]] const std::optional<Failure>& failure() const { return m_failure; }

private:
  [[nodiscard]] bool atEnd() const { return m_pos >= m_text.size(); }
  [[nodiscard]] char peek() const { return atEnd() ? '\0' : m_text[m_pos]; }

  void skipSpaces() {
    while (!atEnd() && (m_text[m_pos] == ' ' || m_text[m_pos] == '\t' || m_text[m_pos] == '\r')) {
      ++m_pos;
    }
  }

  void skipWhitespace() {
    while (!atEnd() && safeIsSpace(m_text[m_pos])) {
      ++m_pos;
    }
  }

  [[nodiscard]] u32 currentLine() const {
    const auto end = m_text.begin() + static_cast<std::ptrdiff_t>(std::min(m_pos, m_text.size()));
    return m_firstLine + static_cast<u32>(std::count(m_text.begin(), end, '\n'));
  }

  void fail(ErrorCode code, std::string message) {
    if (!m_failure) {
      m_failure = Failure{code, std::move(message), currentLine()};
    }
  }

  std::optional<std::string> readKey() {
    if (peek() == '"') {
      return readString();
    }
    const usize start = m_pos;
    while (!atEnd() && isIdentifierChar(m_text[m_pos])) {
      ++m_pos;
    }
    if (m_pos == start) {
      fail(ErrorCode::MalformedDeclaration,
           std::string("Expected a variable name, found '") + peek() + "'");
      return std::nullopt;
    }
    return std::string(m_text.substr(start, m_pos - start));
  }

  std::optional<std::string> readString() {
    ++m_pos; // opening quote
    std::string out;
    while (!atEnd()) {
      char c = m_text[m_pos++];
      if (c == '"') {
        return out;
      }
      if (c == '\n') {
        break;
      }
      if (c == '\\' && !atEnd()) {
        char esc = m_text[m_pos++];
        switch (esc) {
        case 'n':
          out += '\n';
          break;
        case 't':
          out += '\t';
          break;
        case 'r':
          out += '\r';
          break;
        default:
          out += esc;
          break;
        }
        continue;
      }
      out += c;
    }
    fail(ErrorCode::MalformedDeclaration, "Unterminated string literal");
    return std::nullopt;
  }

  std::optional<Value> readValue() {
    const char c = peek();
    if (atEnd() || c == ',' || c == '}' || c == '\n') {
      return Value{};
    }
    if (c == '"') {
      auto s = readString();
      if (!s) {
        return std::nullopt;
      }
      return Value(std::move(*s));
    }
    if (c == '{') {
      auto entries = readMap();
      if (!entries) {
        return std::nullopt;
      }
      return Value::map(std::move(*entries));
    }
    if (safeIsDigit(c) || c == '-' || c == '+' || c == '.') {
      const usize start = m_pos;
      while (!atEnd() && (safeIsDigit(m_text[m_pos]) || m_text[m_pos] == '.' ||
                          m_text[m_pos] == 'e' || m_text[m_pos] == 'E' ||
                          m_text[m_pos] == '-' || m_text[m_pos] == '+')) {
        ++m_pos;
      }
      const std::string token(m_text.substr(start, m_pos - start));
      char* end = nullptr;
      const f64 number = std::strtod(token.c_str(), &end);
      if (end != token.c_str() + token.size()) {
        fail(ErrorCode::MalformedDeclaration, "Invalid number '" + token + "'");
        return std::nullopt;
      }
      return Value(number);
    }
    if (isIdentifierChar(c)) {
      const usize start = m_pos;
      while (!atEnd() && isIdentifierChar(m_text[m_pos])) {
        ++m_pos;
      }
      const std::string word(m_text.substr(start, m_pos - start));
      if (word == "true") {
        return Value(true);
      }
      if (word == "false") {
        return Value(false);
      }
      fail(ErrorCode::MalformedDeclaration,
           "Invalid value '" + word + "'; text values must be quoted");
      return std::nullopt;
    }
    fail(ErrorCode::MalformedDeclaration, std::string("Unexpected character '") + c + "'");
    return std::nullopt;
  }

  std::string_view m_text;
  u32 m_firstLine;
  usize m_pos = 0;
  std::optional<Failure> m_failure;
};

} // anonymous namespace

Parser::Parser() = default;

Parser::~Parser() = default;

void Parser::reset() {
  m_lines.clear();
  m_document = Document{};
  m_errors.clear();
  m_currentNode.reset();
  m_discardCurrentNode = false;
  m_pendingText.clear();
  m_pendingTextLocation = {};
  m_seenTopic = false;
  m_seenDescription = false;
  m_seenAuthor = false;
  m_seenVersion = false;
  m_seenGlobalBlock = false;
}

void Parser::splitLines(std::string_view source) {
  u32 number = 1;
  usize start = 0;
  while (start <= source.size()) {
    usize end = source.find('\n', start);
    if (end == std::string_view::npos) {
      end = source.size();
    }
    std::string_view raw = source.substr(start, end - start);
    if (!raw.empty() && raw.back() == '\r') {
      raw.remove_suffix(1);
    }

    Line line;
    line.number = number;
    usize firstNonBlank = 0;
    while (firstNonBlank < raw.size() && safeIsSpace(raw[firstNonBlank])) {
      ++firstNonBlank;
    }
    line.column = static_cast<u32>(firstNonBlank + 1);
    line.text = trim(raw);
    m_lines.push_back(std::move(line));

    ++number;
    if (end == source.size()) {
      break;
    }
    start = end + 1;
  }
}

ScriptError& Parser::report(ErrorCode code, std::string message, SourceLocation loc) {
  return m_errors.addError(code, std::move(message), loc).withFilePath(m_fileName);
}

ScriptError& Parser::warn(ErrorCode code, std::string message, SourceLocation loc) {
  return m_errors.addWarning(code, std::move(message), loc).withFilePath(m_fileName);
}

Result<Document, ScriptError> Parser::parse(std::string_view source, const std::string& fileName,
                                            bool isEntryFile) {
  reset();
  m_fileName = normalizeScriptName(fileName);
  m_isEntry = isEntryFile;
  m_document.name = m_fileName;
  m_document.declaresGlobal = isEntryFile;

  splitLines(source);

  bool inHeader = true;
  for (usize i = 0; i < m_lines.size(); ++i) {
    const Line& line = m_lines[i];
    const std::string& t = line.text;

    if (t.empty()) {
      continue;
    }
    if (t.front() == '#') {
      if (inHeader) {
        parseMetadataLine(line);
      }
      continue;
    }
    if (inHeader) {
      inHeader = false;
      validateMetadata();
    }

    if (startsWith(t, GLOBAL_VARS) || startsWith(t, LOCAL_VARS)) {
      const bool global = startsWith(t, GLOBAL_VARS);
      const usize prefix = global ? GLOBAL_VARS.size() : LOCAL_VARS.size();
      // "$local_varsX" is not a directive
      if (t.size() == prefix || !isIdentifierChar(t[prefix])) {
        flushText();
        i = parseDeclarationBlock(i, global ? Scope::Global : Scope::Local, prefix);
        continue;
      }
    }

    if (t.front() == '@') {
      flushText();
      finishNode();
      startNode(line);
      continue;
    }

    if (!m_currentNode) {
      if (t.front() == '$' && !startsWith(t, "${")) {
        report(ErrorCode::MalformedDeclaration, "Unknown directive '" + t + "'",
               {line.number, line.column});
      } else {
        warn(ErrorCode::ContentOutsideNode, "Content before the first node is ignored",
             {line.number, line.column});
        BRANCHLINE_LOG_WARN("{}:{}: content before the first node is ignored", m_fileName,
                            line.number);
      }
      continue;
    }

    if (startsWith(t, "!{")) {
      flushText();
      parseCall(line);
    } else if (startsWith(t, "?{") || t.front() == '{' || startsWith(t, "->")) {
      flushText();
      parseBranch(line);
    } else {
      if (m_pendingText.empty()) {
        m_pendingTextLocation = {line.number, line.column};
      }
      m_pendingText.push_back(t);
    }
  }

  if (inHeader) {
    validateMetadata();
  }
  flushText();
  finishNode();

  if (const ScriptError* first = m_errors.firstError()) {
    ScriptError error = *first;
    error.withSource(std::string(source));
    return Result<Document, ScriptError>::error(std::move(error));
  }

  BRANCHLINE_LOG_DEBUG("Parsed {}: {} node(s), {} local and {} global default(s)", m_fileName,
                       m_document.nodes.size(), m_document.localDefaults.size(),
                       m_document.globalDefaults.size());
  return Result<Document, ScriptError>::ok(std::move(m_document));
}

// =============================================================================
// Metadata
// =============================================================================

void Parser::parseMetadataLine(const Line& line) {
  std::string_view body = line.text;
  while (!body.empty() && body.front() == '#') {
    body.remove_prefix(1);
  }

  const auto colon = body.find(':');
  if (colon == std::string_view::npos) {
    return; // plain comment
  }

  const std::string key = toLower(trim(body.substr(0, colon)));
  const std::string value = trim(body.substr(colon + 1));

  if (key == "topic") {
    m_document.metadata.topic = value;
    m_seenTopic = true;
  } else if (key == "description") {
    m_document.metadata.description = value;
    m_seenDescription = true;
  } else if (key == "author") {
    m_document.metadata.author = value;
    m_seenAuthor = true;
  } else if (key == "version") {
    m_document.metadata.version = value;
    m_seenVersion = true;
  } else if (key == "required") {
    parseRequiredList(value, line);
  }
}

void Parser::parseRequiredList(const std::string& value, const Line& line) {
  usize start = 0;
  while (start <= value.size()) {
    usize comma = value.find(',', start);
    if (comma == std::string::npos) {
      comma = value.size();
    }
    const std::string entry = trim(std::string_view(value).substr(start, comma - start));
    start = comma + 1;

    if (entry.empty()) {
      if (comma == value.size()) {
        break;
      }
      continue;
    }

    const auto dot = entry.find_last_of('.');
    if (dot == std::string::npos || entry.substr(dot) != SCRIPT_EXTENSION) {
      report(ErrorCode::InvalidDependency,
             "Dependency '" + entry + "' must be a " + std::string(SCRIPT_EXTENSION) + " file",
             {line.number, line.column});
      continue;
    }

    std::string normalized = normalizeScriptName(entry);
    auto& required = m_document.metadata.required;
    if (std::find(required.begin(), required.end(), normalized) != required.end()) {
      report(ErrorCode::InvalidDependency, "Duplicate dependency '" + normalized + "'",
             {line.number, line.column});
      continue;
    }
    required.push_back(std::move(normalized));
  }
}

void Parser::validateMetadata() {
  const std::pair<bool, const char*> keys[] = {{m_seenTopic, "Topic"},
                                               {m_seenDescription, "Description"},
                                               {m_seenAuthor, "Author"},
                                               {m_seenVersion, "Version"}};
  for (const auto& [seen, name] : keys) {
    if (!seen) {
      report(ErrorCode::MissingMetadata,
             std::string("Missing required metadata '# ") + name + ": ...'", {1, 1});
    }
  }
}

// =============================================================================
// Variable declarations
// =============================================================================

usize Parser::parseDeclarationBlock(usize index, Scope scope, usize prefixLength) {
  const Line& first = m_lines[index];
  const std::string directive = first.text.substr(0, prefixLength);
  const SourceLocation loc{first.number, first.column};

  // Scope rules come first; the block is still read so parsing resumes after it
  bool rejected = false;
  if (scope == Scope::Global) {
    if (!m_isEntry) {
      report(ErrorCode::GlobalOutsideEntry,
             "$global_vars may only be declared in the entry file", loc)
          .withSuggestion("Move these declarations to the entry file or use $local_vars");
      rejected = true;
    } else if (m_seenGlobalBlock) {
      report(ErrorCode::DuplicateVariable, "$global_vars is declared more than once", loc)
          .withSuggestion("Merge the declarations into the first $global_vars block");
      rejected = true;
    }
    m_seenGlobalBlock = true;
  }

  std::string rest = trim(std::string_view(first.text).substr(prefixLength));
  if (rest.empty() || rest.front() != ':') {
    report(ErrorCode::MalformedDeclaration, "Expected ':' after " + directive, loc);
    return index;
  }
  rest = trim(std::string_view(rest).substr(1));

  // Gather lines until the opening brace is balanced. Comment lines are kept
  // as empty lines so line numbers stay aligned.
  std::string text = rest;
  usize last = index;
  usize lineStart = 0; // offset of the current line inside `text`
  bool opened = false;
  bool inString = false;
  int depth = 0;
  std::optional<usize> closePos;

  auto scan = [&](usize from) {
    for (usize p = from; p < text.size(); ++p) {
      const char c = text[p];
      if (inString) {
        if (c == '\\') {
          ++p;
        } else if (c == '"' || c == '\n') {
          inString = false;
        }
        continue;
      }
      if (c == '"') {
        inString = true;
      } else if (c == '{') {
        opened = true;
        ++depth;
      } else if (c == '}') {
        --depth;
        if (opened && depth == 0) {
          closePos = p;
          return;
        }
      } else if (!opened && !safeIsSpace(c)) {
        closePos = std::string::npos; // something other than '{' first
        return;
      }
    }
  };

  scan(0);
  while (!closePos && last + 1 < m_lines.size()) {
    ++last;
    const Line& next = m_lines[last];
    const bool comment = !next.text.empty() && next.text.front() == '#';
    const usize from = text.size();
    text += '\n';
    lineStart = text.size();
    if (!comment) {
      text += next.text;
    }
    scan(from);
  }

  if (!closePos || *closePos == std::string::npos) {
    if (!closePos) {
      report(ErrorCode::MalformedDeclaration, "Unterminated " + directive + " block", loc);
    } else {
      report(ErrorCode::MalformedDeclaration, "Expected '{' after " + directive + ":", loc);
    }
    return closePos ? last : m_lines.size() - 1;
  }

  const std::string trailing = trim(std::string_view(text).substr(*closePos + 1));
  if (!trailing.empty()) {
    report(ErrorCode::MalformedDeclaration, "Unexpected text after the closing '}'",
           {m_lines[last].number, m_lines[last].column + static_cast<u32>(*closePos - lineStart)});
  }

  DeclarationReader reader(std::string_view(text).substr(0, *closePos + 1), first.number);
  std::vector<u32> keyLines;
  auto entries = reader.readMap(&keyLines);
  if (!entries) {
    const auto& failure = *reader.failure();
    report(failure.code, failure.message, {failure.line, 1});
    return last;
  }

  if (rejected) {
    return last;
  }

  VariableMap& target =
      scope == Scope::Global ? m_document.globalDefaults : m_document.localDefaults;
  for (usize k = 0; k < entries->size(); ++k) {
    auto& [name, value] = (*entries)[k];
    if (target.count(name) > 0) {
      report(ErrorCode::DuplicateVariable, "Variable '" + name + "' is declared more than once",
             {keyLines[k], 1});
      continue;
    }
    target.emplace(name, std::move(value));
  }

  return last;
}

// =============================================================================
// Nodes
// =============================================================================

void Parser::startNode(const Line& line) {
  const std::string name = trim(std::string_view(line.text).substr(1));
  const SourceLocation loc{line.number, line.column};

  m_currentNode = Node{};
  m_currentNode->name = name;
  m_currentNode->location = loc;
  m_discardCurrentNode = false;

  if (!isValidNodeName(name)) {
    report(ErrorCode::InvalidNodeName,
           "Invalid node name '" + name + "'; use letters, digits and '_'", loc);
    m_discardCurrentNode = true;
    return;
  }

  if (const Node* existing = m_document.findNode(name)) {
    report(ErrorCode::DuplicateNode, "Node '" + name + "' is already defined", loc)
        .withRelated(existing->location, "first defined here");
    m_discardCurrentNode = true;
  }
}

void Parser::finishNode() {
  if (!m_currentNode) {
    return;
  }
  if (!m_discardCurrentNode) {
    std::string name = m_currentNode->name;
    m_document.nodeOrder.push_back(name);
    m_document.nodes.emplace(std::move(name), std::move(*m_currentNode));
  }
  m_currentNode.reset();
  m_discardCurrentNode = false;
}

void Parser::flushText() {
  if (m_pendingText.empty() || !m_currentNode) {
    m_pendingText.clear();
    return;
  }

  TextElement element;
  element.location = m_pendingTextLocation;
  for (usize i = 0; i < m_pendingText.size(); ++i) {
    if (i > 0) {
      element.text += '\n';
    }
    element.text += m_pendingText[i];
  }
  m_currentNode->content.emplace_back(std::move(element));
  m_pendingText.clear();
}

void Parser::parseCall(const Line& line) {
  const std::string& t = line.text;
  const SourceLocation loc{line.number, line.column};

  const auto close = t.find('}', 2);
  if (close == std::string::npos) {
    report(ErrorCode::MalformedCall, "Expected '}' after the function name", loc);
    return;
  }

  CallElement call;
  call.location = loc;
  call.function = trim(std::string_view(t).substr(2, close - 2));
  if (!isValidNodeName(call.function)) {
    report(ErrorCode::MalformedCall, "Invalid function name '" + call.function + "'", loc);
    return;
  }

  std::string_view rest = std::string_view(t).substr(close + 1);
  while (!rest.empty() && safeIsSpace(rest.front())) {
    rest.remove_prefix(1);
  }
  if (rest.empty() || rest.front() != ':') {
    report(ErrorCode::MalformedCall,
           "Expected ':' and result bindings after !{" + call.function + "}", loc)
        .withSuggestion("!{" + call.function + "} : ~{result}");
    return;
  }
  rest.remove_prefix(1);

  while (true) {
    while (!rest.empty() && (safeIsSpace(rest.front()) || rest.front() == ',')) {
      rest.remove_prefix(1);
    }
    if (rest.empty()) {
      break;
    }
    if (!startsWith(rest, "~{")) {
      report(ErrorCode::MalformedCall,
             "Expected a binding of the form ~{name}, found '" + std::string(rest) + "'", loc);
      return;
    }
    const auto end = rest.find('}');
    if (end == std::string_view::npos) {
      report(ErrorCode::MalformedCall, "Unterminated binding '" + std::string(rest) + "'", loc);
      return;
    }
    std::string binding = trim(rest.substr(2, end - 2));
    if (!isValidNodeName(binding)) {
      report(ErrorCode::MalformedCall, "Invalid binding name '" + binding + "'", loc);
      return;
    }
    call.bindings.push_back(std::move(binding));
    rest.remove_prefix(end + 1);
  }

  if (call.bindings.empty()) {
    report(ErrorCode::MalformedCall,
           "Call to '" + call.function + "' needs at least one ~{binding}", loc);
    return;
  }

  m_currentNode->content.emplace_back(std::move(call));
}

void Parser::parseBranch(const Line& line) {
  const std::string& t = line.text;
  const SourceLocation loc{line.number, line.column};

  auto destinationAfterArrow = [&](std::string_view rest) -> std::optional<Destination> {
    while (!rest.empty() && safeIsSpace(rest.front())) {
      rest.remove_prefix(1);
    }
    if (!startsWith(rest, "->")) {
      report(ErrorCode::MalformedBranch, "Expected '->' followed by a destination", loc);
      return std::nullopt;
    }
    return parseDestination(trim(rest.substr(2)), line);
  };

  if (startsWith(t, "->")) {
    auto destination = destinationAfterArrow(t);
    if (destination) {
      m_currentNode->branches.emplace_back(GotoBranch{std::move(*destination), loc});
    }
    return;
  }

  const bool isCondition = startsWith(t, "?{");
  const usize open = isCondition ? 2 : 1;
  const auto close = t.find('}', open);
  if (close == std::string::npos) {
    report(ErrorCode::MalformedBranch, "Expected '}' to close the branch header", loc);
    return;
  }
  const std::string_view inner = std::string_view(t).substr(open, close - open);

  if (isCondition) {
    std::string variable = trim(inner);
    if (!isValidVariablePath(variable)) {
      report(ErrorCode::MalformedBranch, "Invalid condition variable '" + variable + "'", loc);
      return;
    }
    auto destination = destinationAfterArrow(std::string_view(t).substr(close + 1));
    if (destination) {
      m_currentNode->branches.emplace_back(
          ConditionBranch{std::move(variable), std::move(*destination), loc});
    }
    return;
  }

  OptionBranch option;
  option.location = loc;
  usize start = 0;
  while (start <= inner.size()) {
    usize comma = inner.find(',', start);
    if (comma == std::string_view::npos) {
      comma = inner.size();
    }
    std::string keyword = normalizeInput(inner.substr(start, comma - start));
    if (!keyword.empty()) {
      option.keywords.insert(std::move(keyword));
    }
    if (comma == inner.size()) {
      break;
    }
    start = comma + 1;
  }

  if (option.keywords.empty()) {
    report(ErrorCode::MalformedBranch, "Option needs at least one keyword", loc);
    return;
  }

  auto destination = destinationAfterArrow(std::string_view(t).substr(close + 1));
  if (destination) {
    option.destination = std::move(*destination);
    m_currentNode->branches.emplace_back(std::move(option));
  }
}

std::optional<Destination> Parser::parseDestination(std::string_view text, const Line& line) {
  const SourceLocation loc{line.number, line.column};

  if (text.empty()) {
    report(ErrorCode::MalformedBranch, "Missing destination after '->'", loc);
    return std::nullopt;
  }

  if (toLower(text) == "{exit}") {
    return Destination{ExitTarget{}};
  }

  if (text.front() == '[') {
    if (text.back() != ']') {
      report(ErrorCode::MalformedBranch, "Expected ']' to close the file transfer", loc);
      return std::nullopt;
    }
    const std::string_view inner = text.substr(1, text.size() - 2);

    // The separating ':' is the first one outside any ${...} token
    usize separator = std::string_view::npos;
    int braceDepth = 0;
    for (usize p = 0; p < inner.size(); ++p) {
      if (inner[p] == '{') {
        ++braceDepth;
      } else if (inner[p] == '}') {
        --braceDepth;
      } else if (inner[p] == ':' && braceDepth == 0) {
        separator = p;
        break;
      }
    }
    if (separator == std::string_view::npos) {
      report(ErrorCode::MalformedBranch,
             "File transfer must have the form [file:node], found '" + std::string(text) + "'",
             loc);
      return std::nullopt;
    }

    FileTransferTarget target;
    target.file = trim(inner.substr(0, separator));
    target.node = trim(inner.substr(separator + 1));
    if (!target.node.empty() && target.node.front() == '@') {
      target.node.erase(0, 1);
    }

    if (target.file.empty() || target.node.empty()) {
      report(ErrorCode::MalformedBranch, "File transfer needs both a file and a node", loc);
      return std::nullopt;
    }
    if (!containsInterpolation(target.file)) {
      target.file = normalizeScriptName(target.file);
    }
    if (!containsInterpolation(target.node) && !isValidNodeName(target.node)) {
      report(ErrorCode::MalformedBranch, "Invalid node name '" + target.node + "' in transfer",
             loc);
      return std::nullopt;
    }
    return Destination{std::move(target)};
  }

  if (startsWith(text, "${") && text.back() == '}' && text.find("${", 2) == std::string_view::npos) {
    std::string variable = trim(text.substr(2, text.size() - 3));
    if (!isValidVariablePath(variable)) {
      report(ErrorCode::MalformedBranch, "Invalid destination variable '" + variable + "'", loc);
      return std::nullopt;
    }
    return Destination{DynamicTarget{std::move(variable)}};
  }

  std::string node(text);
  if (!node.empty() && node.front() == '@') {
    node.erase(0, 1);
  }
  if (!isValidNodeName(node)) {
    report(ErrorCode::MalformedBranch, "Invalid destination '" + std::string(text) + "'", loc);
    return std::nullopt;
  }
  return Destination{NodeTarget{std::move(node)}};
}

} // namespace Branchline::scripting
