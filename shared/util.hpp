#pragma once

#define ILWEAVE_ID "ilweave"
#define ILWEAVE_VERSION "0.1.0"

#define ILWEAVE_EXPORT __attribute__((visibility("default")))

#include <fmt/core.h>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <variant>
#include <utility>

#ifndef ILWEAVE_NO_DEBUG_LOGS
#define ILWEAVE_DEBUG(...)                                 \
  do {                                                     \
    fmt::print(stderr, "[" ILWEAVE_ID "] " __VA_ARGS__); \
    fmt::print(stderr, "\n");                              \
  } while (0)
#define ILWEAVE_ASSERT(...) assert(__VA_ARGS__)
#else
#define ILWEAVE_DEBUG(...)
#define ILWEAVE_ASSERT(...) static_cast<void>(0)
#endif

#define ILWEAVE_CRITICAL(...)                                       \
  do {                                                              \
    fmt::print(stderr, "[" ILWEAVE_ID "|CRIT] " __VA_ARGS__);     \
    fmt::print(stderr, "\n");                                       \
  } while (0)
#define ILWEAVE_ABORT(...)            \
  do {                                \
    ILWEAVE_CRITICAL(__VA_ARGS__);    \
    std::fflush(stderr);              \
    std::abort();                     \
  } while (0)

namespace ilweave {

namespace util {
/// @brief Visitor helper for std::visit over the error variants.
template <class... Ts>
struct overload : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overload(Ts...) -> overload<Ts...>;
}  // namespace util

template <class T>
struct is_variant {
  constexpr static bool value = false;
};

template <class... TArgs>
struct is_variant<std::variant<TArgs...>> {
  constexpr static bool value = true;
};

template <class T, class E>
struct Result {
  std::variant<E, T> data;
  template <class... TArgs>
  static Result Ok(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<1>{}, std::forward<TArgs>(args)...) };
  }
  template <class... TArgs>
  static Result Err(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<0>{}, std::forward<TArgs>(args)...) };
  }
  // Helper function for if E is a variant (we have multiple errors and need to construct one)
  template <class ET, class... TArgs>
    requires(is_variant<E>::value)
  static Result ErrAt(TArgs&&... args) {
    return Result{ std::variant<E, T>(std::in_place_index_t<0>{},
                                      E(std::in_place_type_t<ET>{}, std::forward<TArgs>(args)...)) };
  }
  T const& value() const& {
    return std::get<1>(data);
  }
  T&& value() && {
    return std::get<1>(std::move(data));
  }
  E const& error() const {
    return std::get<0>(data);
  }
  bool has_value() const {
    return data.index() == 1;
  }
};

}  // namespace ilweave
