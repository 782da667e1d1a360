#pragma once

/**
 * @file value.hpp
 * @brief Script values: string, number, boolean, empty, or an ordered map
 */

#include "Branchline/core/types.hpp"
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Branchline::scripting {

class Value {
public:
  enum class Kind : u8 { Empty, String, Number, Boolean, Map };

  using Entry = std::pair<std::string, Value>;

  Value() = default;
  Value(std::string s) : m_kind(Kind::String), m_string(std::move(s)) {}
  Value(const char* s) : m_kind(Kind::String), m_string(s) {}
  Value(f64 n) : m_kind(Kind::Number), m_number(n) {}
  Value(i32 n) : m_kind(Kind::Number), m_number(static_cast<f64>(n)) {}
  Value(bool b) : m_kind(Kind::Boolean), m_boolean(b) {}

  [[nodiscard]] static Value map(std::vector<Entry> entries = {});

  [[nodiscard]] Kind kind() const { return m_kind; }
  [[nodiscard]] bool isEmpty() const { return m_kind == Kind::Empty; }
  [[nodiscard]] bool isString() const { return m_kind == Kind::String; }
  [[nodiscard]] bool isNumber() const { return m_kind == Kind::Number; }
  [[nodiscard]] bool isBoolean() const { return m_kind == Kind::Boolean; }
  [[nodiscard]] bool isMap() const { return m_kind == Kind::Map; }

  /// Accessors return a neutral value ("", 0, false, no entries) on kind mismatch
  [[nodiscard]] const std::string& stringValue() const { return m_string; }
  [[nodiscard]] f64 numberValue() const { return m_number; }
  [[nodiscard]] bool booleanValue() const { return m_boolean; }
  [[nodiscard]] const std::vector<Entry>& entries() const { return m_entries; }

  /**
   * @brief Member of a map value, or nullptr
   */
  [[nodiscard]] const Value* find(std::string_view key) const;

  /**
   * @brief Insert or replace a map member; turns an Empty value into a map
   * @return false if this value is neither Empty nor a map
   */
  bool set(std::string key, Value value);

  bool operator==(const Value& other) const;

private:
  Kind m_kind = Kind::Empty;
  std::string m_string;
  f64 m_number = 0.0;
  bool m_boolean = false;
  std::vector<Entry> m_entries;
};

using VariableMap = std::unordered_map<std::string, Value>;

/**
 * @brief Truthiness used by conditions
 *
 * Empty, false, 0 and the strings "false" and "0" are falsy; everything else
 * (including "" and an empty map) is truthy.
 */
[[nodiscard]] bool asBool(const Value& value);

/**
 * @brief Text used when a value is interpolated into rendered output
 *
 * Integral numbers print without a fraction ("5", not "5.0"), Empty prints
 * as "", maps print as "{key: value, ...}".
 */
[[nodiscard]] std::string toDisplayString(const Value& value);

[[nodiscard]] const char* kindName(Value::Kind kind);

} // namespace Branchline::scripting
