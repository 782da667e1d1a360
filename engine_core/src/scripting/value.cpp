#include "Branchline/scripting/value.hpp"
#include <cmath>
#include <format>
#include <limits>

namespace Branchline::scripting {

Value Value::map(std::vector<Entry> entries) {
  Value v;
  v.m_kind = Kind::Map;
  v.m_entries = std::move(entries);
  return v;
}

const Value* Value::find(std::string_view key) const {
  if (m_kind != Kind::Map) {
    return nullptr;
  }
  for (const auto& [name, value] : m_entries) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

bool Value::set(std::string key, Value value) {
  if (m_kind == Kind::Empty) {
    m_kind = Kind::Map;
  } else if (m_kind != Kind::Map) {
    return false;
  }

  for (auto& entry : m_entries) {
    if (entry.first == key) {
      entry.second = std::move(value);
      return true;
    }
  }
  m_entries.emplace_back(std::move(key), std::move(value));
  return true;
}

bool Value::operator==(const Value& other) const {
  if (m_kind != other.m_kind) {
    return false;
  }
  switch (m_kind) {
  case Kind::Empty:
    return true;
  case Kind::String:
    return m_string == other.m_string;
  case Kind::Number:
    return m_number == other.m_number;
  case Kind::Boolean:
    return m_boolean == other.m_boolean;
  case Kind::Map:
    return m_entries == other.m_entries;
  }
  return false;
}

bool asBool(const Value& value) {
  switch (value.kind()) {
  case Value::Kind::Empty:
    return false;
  case Value::Kind::Boolean:
    return value.booleanValue();
  case Value::Kind::Number:
    return value.numberValue() != 0.0;
  case Value::Kind::String:
    return value.stringValue() != "false" && value.stringValue() != "0";
  case Value::Kind::Map:
    return true;
  }
  return false;
}

std::string toDisplayString(const Value& value) {
  switch (value.kind()) {
  case Value::Kind::Empty:
    return "";
  case Value::Kind::String:
    return value.stringValue();
  case Value::Kind::Boolean:
    return value.booleanValue() ? "true" : "false";
  case Value::Kind::Number: {
    const f64 n = value.numberValue();
    if (std::isfinite(n) && std::trunc(n) == n &&
        std::fabs(n) < static_cast<f64>(std::numeric_limits<i64>::max())) {
      return std::to_string(static_cast<i64>(n));
    }
    return std::format("{}", n);
  }
  case Value::Kind::Map: {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, member] : value.entries()) {
      if (!first) {
        out += ", ";
      }
      first = false;
      out += key;
      out += ": ";
      out += toDisplayString(member);
    }
    out += "}";
    return out;
  }
  }
  return "";
}

const char* kindName(Value::Kind kind) {
  switch (kind) {
  case Value::Kind::Empty:
    return "empty";
  case Value::Kind::String:
    return "string";
  case Value::Kind::Number:
    return "number";
  case Value::Kind::Boolean:
    return "boolean";
  case Value::Kind::Map:
    return "map";
  }
  return "unknown";
}

} // namespace Branchline::scripting
