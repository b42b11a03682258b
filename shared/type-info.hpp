#pragma once

#include <cstddef>
#include <type_traits>
#include <fmt/format.h>
#include <fmt/compile.h>

namespace ilweave {

/// @brief Marks a class type as a value type. Instance methods of value types cannot be intercepted, since the receiver
/// would have to be copied into the wrapper. Specialize for value-like structs to have Wrap reject them.
template <class T>
struct is_value_type : std::bool_constant<std::is_arithmetic_v<T> || std::is_enum_v<T>> {};

/// @brief Represents the type info of a parameter, return or declaring type of an intercepted method
struct TypeInfo {
  std::size_t size{};
  /// @brief Passed by reference; the wrapper forwards the caller's storage and snapshots a copy.
  bool by_ref{ false };
  bool is_void{ false };
  bool is_value_type{ false };

  template <class T>
  [[nodiscard]] inline static TypeInfo from() {
    if constexpr (std::is_reference_v<T>) {
      return TypeInfo{
        .size = sizeof(void*),
        .by_ref = true,
        .is_value_type = ::ilweave::is_value_type<std::remove_cvref_t<T>>::value,
      };
    } else if constexpr (std::is_void_v<T>) {
      return TypeInfo{
        .size = 0,
        .is_void = true,
      };
    } else {
      return TypeInfo{
        .size = sizeof(T),
        .is_value_type = ::ilweave::is_value_type<std::remove_cv_t<T>>::value,
      };
    }
  }
};

inline bool operator==(TypeInfo const& lhs, TypeInfo const& rhs) {
  return lhs.size == rhs.size && lhs.by_ref == rhs.by_ref && lhs.is_void == rhs.is_void &&
         lhs.is_value_type == rhs.is_value_type;
}
}  // namespace ilweave

// Custom formatter for ilweave::TypeInfo
template <>
class fmt::formatter<ilweave::TypeInfo> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::TypeInfo const& info, Context& ctx) const {
    if (info.is_void) return fmt::format_to(ctx.out(), "(void)");
    return fmt::format_to(ctx.out(), "(size={}{}{})", info.size, info.by_ref ? ", by ref" : "",
                          info.is_value_type ? ", value type" : "");
  }
};
