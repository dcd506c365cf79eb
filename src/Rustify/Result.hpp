#pragma once

#include <fmt/core.h>
#include <memory>
#include <mitama/anyhow/anyhow.hpp>
#include <mitama/result/result.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace anyhow = mitama::anyhow;

// NOLINTBEGIN(readability-identifier-naming,cppcoreguidelines-macro-usage)

#define Try(...) MITAMA_TRY(__VA_ARGS__)
#define Bail(...) MITAMA_BAIL(__VA_ARGS__)
#define Ensure(...) MITAMA_ENSURE(__VA_ARGS__)

using AnyhowErr = mitama::failure_t<std::shared_ptr<anyhow::error>>;

struct UseAnyhow {};

template <typename T, typename E = UseAnyhow>
using Result = std::conditional_t<
    std::is_same_v<E, UseAnyhow>, anyhow::result<T>, mitama::result<T, E>>;

template <typename... Args>
inline auto
Ok(Args&&... args) -> decltype(mitama::success(std::forward<Args>(args)...)) {
  return mitama::success(std::forward<Args>(args)...);
}

template <typename E = void, typename... Args>
  requires std::is_void_v<E> || std::is_base_of_v<anyhow::error, E>
inline auto
Err(Args&&... args) {
  if constexpr (std::is_void_v<E>) {
    return mitama::failure(std::forward<Args>(args)...);
  } else {
    return anyhow::failure<E>(std::forward<Args>(args)...);
  }
}

// Wraps the error of `res`, if any, with a formatted outer message.  The
// original error is kept as the cause.
template <typename T, typename... Args>
inline anyhow::result<T> withContext(
    anyhow::result<T> res, fmt::format_string<Args...> fmt, Args&&... args
) {
  std::string msg = fmt::format(fmt, std::forward<Args>(args)...);
  return std::move(res).with_context([msg = std::move(msg)] {
    return anyhow::anyhow(msg);
  });
}

// NOLINTEND(readability-identifier-naming,cppcoreguidelines-macro-usage)
