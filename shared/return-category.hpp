#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fmt/compile.h>

namespace ilweave {
/// @brief The closed set of return shapes a default-return body can be synthesized for.
/// Unsupported covers everything else (value types returned by value, typedref, type variables that may bind to value
/// types, unknown encodings), and is rejected by the encoder.
enum struct ReturnCategory : uint8_t {
  Void,
  /// @brief bool, char and 8/16/32 bit integrals, all of which live as int32 on the evaluation stack.
  Int32,
  Int64,
  /// @brief native int/uint, unmanaged pointers and managed by-ref returns.
  NativeInt,
  Float32,
  Float64,
  /// @brief string, class, object, arrays and generic instances of classes.
  Reference,
  Unsupported,
};

/// @brief Maps the leading element type of a signature's return type to a category.
/// @param element The element type byte, after custom modifiers have been skipped.
/// @param generic_of_value_type Only consulted for GENERICINST; true if the instantiated type is a VALUETYPE.
[[nodiscard]] ReturnCategory CategoryForElementType(uint8_t element, bool generic_of_value_type = false);

}  // namespace ilweave

// Custom formatter for ilweave::ReturnCategory
template <>
class fmt::formatter<ilweave::ReturnCategory> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::ReturnCategory const& category, Context& ctx) const {
    switch (category) {
      case ilweave::ReturnCategory::Void:
        return format_to(ctx.out(), "void");
      case ilweave::ReturnCategory::Int32:
        return format_to(ctx.out(), "int32");
      case ilweave::ReturnCategory::Int64:
        return format_to(ctx.out(), "int64");
      case ilweave::ReturnCategory::NativeInt:
        return format_to(ctx.out(), "native int");
      case ilweave::ReturnCategory::Float32:
        return format_to(ctx.out(), "float32");
      case ilweave::ReturnCategory::Float64:
        return format_to(ctx.out(), "float64");
      case ilweave::ReturnCategory::Reference:
        return format_to(ctx.out(), "reference");
      case ilweave::ReturnCategory::Unsupported:
        return format_to(ctx.out(), "unsupported");
    }
    return format_to(ctx.out(), "unknown");
  }
};
