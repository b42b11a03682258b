#pragma once

#include <cstdint>
#include <fmt/format.h>
#include <fmt/compile.h>

namespace ilweave {
/// @brief Represents the calling convention kind stored in the low nibble of a method signature.
/// Only Default and Vararg appear on managed MethodDef signatures; the unmanaged kinds come from P/Invoke shapes.
enum struct CallingConvention : uint8_t { Default = 0, Cdecl = 1, Stdcall = 2, Thiscall = 3, Fastcall = 4, Vararg = 5 };
}  // namespace ilweave

// Custom formatter for ilweave::CallingConvention
template <>
class fmt::formatter<ilweave::CallingConvention> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::CallingConvention const& conv, Context& ctx) const {
    switch (conv) {
      case ilweave::CallingConvention::Default:
        return format_to(ctx.out(), "Default");
      case ilweave::CallingConvention::Cdecl:
        return format_to(ctx.out(), "Cdecl");
      case ilweave::CallingConvention::Stdcall:
        return format_to(ctx.out(), "Stdcall");
      case ilweave::CallingConvention::Thiscall:
        return format_to(ctx.out(), "Thiscall");
      case ilweave::CallingConvention::Fastcall:
        return format_to(ctx.out(), "Fastcall");
      case ilweave::CallingConvention::Vararg:
        return format_to(ctx.out(), "Vararg");
    }
    return format_to(ctx.out(), "Unknown({})", static_cast<int>(conv));
  }
};
