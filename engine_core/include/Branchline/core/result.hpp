#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across the engine
 *
 * Engine APIs never throw across their public surface. Fallible operations
 * return a Result that either holds a value or an error description. The
 * error type defaults to a human readable string; subsystems that need a
 * machine readable category (e.g. the script diagnostics) supply their own.
 */

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace Branchline {

template <typename T, typename E = std::string> class Result {
public:
  [[nodiscard]] static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  [[nodiscard]] static Result error(E err) { return Result(std::in_place_index<1>, std::move(err)); }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }

  [[nodiscard]] T& value() & { return std::get<0>(m_data); }
  [[nodiscard]] const T& value() const& { return std::get<0>(m_data); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_data)); }

  [[nodiscard]] const E& error() const { return std::get<1>(m_data); }

  [[nodiscard]] T valueOr(T fallback) const {
    if (isOk()) {
      return std::get<0>(m_data);
    }
    return fallback;
  }

  explicit operator bool() const { return isOk(); }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : m_data(tag, std::forward<U>(payload)) {}

  std::variant<T, E> m_data;
};

template <typename E> class Result<void, E> {
public:
  [[nodiscard]] static Result ok() { return Result(); }

  [[nodiscard]] static Result error(E err) {
    Result r;
    r.m_error = std::move(err);
    return r;
  }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }

  [[nodiscard]] const E& error() const { return *m_error; }

  explicit operator bool() const { return isOk(); }

private:
  Result() = default;

  std::optional<E> m_error;
};

} // namespace Branchline
