#pragma once

#include <utility>
#include <variant>

namespace bebop {

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T, typename E>
using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] inline bool IsOk(const Result<T, E>& r) noexcept {
  return std::holds_alternative<T>(r);
}

template <typename T, typename E>
[[nodiscard]] inline bool IsError(const Result<T, E>& r) noexcept {
  return std::holds_alternative<E>(r);
}

template <typename T, typename E>
[[nodiscard]] inline const T& GetValue(const Result<T, E>& r) noexcept {
  return std::get<T>(r);
}

template <typename T, typename E>
[[nodiscard]] inline T&& GetValue(Result<T, E>&& r) noexcept {
  return std::get<T>(std::move(r));
}

template <typename T, typename E>
[[nodiscard]] inline E GetError(const Result<T, E>& r) noexcept {
  return std::get<E>(r);
}

}  // namespace bebop
