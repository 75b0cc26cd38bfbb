#pragma once

/**
 * @file result.hpp
 * @brief Result type for operations that can fail
 *
 * A Result holds either a value or an error description. Errors are
 * reported through Result instead of exceptions across module boundaries.
 *
 * @code
 * Result<std::string> readDocument(const std::string& path);
 *
 * auto result = readDocument("notes/trip.md");
 * if (result.isError()) {
 *   LINKKEEPER_LOG_WARN("read failed: " + result.error());
 * }
 * @endcode
 */

#include <optional>
#include <string>
#include <utility>

namespace LinkKeeper {

template <typename T, typename E = std::string> class Result {
public:
  [[nodiscard]] static Result ok(T value) {
    Result r;
    r.m_value = std::move(value);
    return r;
  }

  [[nodiscard]] static Result error(E err) {
    Result r;
    r.m_error = std::move(err);
    return r;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() & { return *m_value; }
  [[nodiscard]] const T& value() const& { return *m_value; }
  [[nodiscard]] T&& value() && { return std::move(*m_value); }

  [[nodiscard]] const E& error() const { return m_error; }

  [[nodiscard]] T valueOr(T fallback) const {
    return m_value.has_value() ? *m_value : std::move(fallback);
  }

private:
  Result() = default;

  std::optional<T> m_value;
  E m_error{};
};

template <typename E> class Result<void, E> {
public:
  [[nodiscard]] static Result ok() { return Result(true, E{}); }

  [[nodiscard]] static Result error(E err) { return Result(false, std::move(err)); }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const E& error() const { return m_error; }

private:
  Result(bool ok, E err) : m_ok(ok), m_error(std::move(err)) {}

  bool m_ok = false;
  E m_error{};
};

} // namespace LinkKeeper
