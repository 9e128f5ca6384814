#pragma once

#include <utility>
#include <variant>
#include "codec_error.hpp"

namespace mbpdu {

/**
 * @brief Value of a fallible codec operation, or the CodecError that stopped it
 *
 * Mirrors the std::optional access pattern (has_value(), operator*, operator->) and adds
 * error() to read the failure reason.
 */
template <typename T>
class Result {
 public:
  Result(T const &value)
      : storage_(value) {}
  Result(T &&value)
      : storage_(std::move(value)) {}
  Result(CodecError error)
      : storage_(error) {}

  [[nodiscard]] bool has_value() const noexcept { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T &value() & { return std::get<T>(storage_); }
  [[nodiscard]] T const &value() const & { return std::get<T>(storage_); }
  [[nodiscard]] T &&value() && { return std::get<T>(std::move(storage_)); }

  // Only valid when has_value() is false
  [[nodiscard]] CodecError error() const { return std::get<CodecError>(storage_); }

  T &operator*() & { return value(); }
  T const &operator*() const & { return value(); }
  T *operator->() { return &value(); }
  T const *operator->() const { return &value(); }

 private:
  std::variant<T, CodecError> storage_;
};

}  // namespace mbpdu
