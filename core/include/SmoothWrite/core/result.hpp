#pragma once

/**
 * @file result.hpp
 * @brief Value-or-error return type used across SmoothWrite
 *
 * Expected failures (missing files, unparsable records, I/O errors) are
 * reported through Result instead of exceptions. The error channel carries a
 * human-readable message suitable for logging.
 *
 * @code
 *   Result<Note> loaded = Note::deserialize(bytes);
 *   if (loaded.isError()) {
 *     SMOOTHWRITE_LOG_WARN("Skipping record: " + loaded.error());
 *   }
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace SmoothWrite {

template <typename T> class Result {
public:
  static Result ok(T value) { return Result(std::move(value), std::string()); }

  static Result error(std::string message) {
    return Result(std::nullopt, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }
  explicit operator bool() const { return isOk(); }

  [[nodiscard]] T& value() & {
    ensureValue();
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    ensureValue();
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    ensureValue();
    return std::move(*m_value);
  }

  [[nodiscard]] T valueOr(T fallback) const {
    return m_value.has_value() ? *m_value : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(std::optional<T> value, std::string message)
      : m_value(std::move(value)), m_error(std::move(message)) {}

  void ensureValue() const {
    if (!m_value.has_value()) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
  }

  std::optional<T> m_value;
  std::string m_error;
};

template <> class Result<void> {
public:
  static Result ok() { return Result(true, std::string()); }

  static Result error(std::string message) { return Result(false, std::move(message)); }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }
  explicit operator bool() const { return m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok;
  std::string m_error;
};

} // namespace SmoothWrite
