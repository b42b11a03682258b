#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <fmt/format.h>

#include "metadata.hpp"
#include "module.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief The size of a fat (extended) method body header, and the minimum size its header size nibble may encode.
constexpr static uint32_t kFatHeaderSize = 12;

enum struct BodyEncoding : uint8_t {
  /// @brief One byte header, code size in the upper six bits.
  Tiny,
  /// @brief Twelve byte header with flags, max stack, code size and local signature token.
  Fat,
};

/// @brief A decoded method body header. header_size + code_size bytes starting at the header are the span an in-place
/// patch may overwrite.
struct BodyHeader {
  BodyEncoding encoding{ BodyEncoding::Tiny };
  uint32_t header_size{};
  uint32_t code_size{};
  /// @brief The low 12 bits of the first fat header word; zero for tiny headers.
  uint16_t flags{};
  /// @brief Set when extra data sections (exception handling clauses) follow the code.
  bool more_sects{ false };

  [[nodiscard]] uint32_t span() const {
    return header_size + code_size;
  }
};

struct LocatedBody {
  uint32_t file_offset{};
  BodyHeader header{};
};

/// @brief Returned by ReadBodyHeader when the bytes do not hold a well formed header.
struct HeaderError {
  std::string reason;
};

namespace locating {

/// @brief The method has RVA zero (abstract, extern or runtime implemented).
struct NoBody {
  MethodDescriptor method;
};
/// @brief The method RVA is not covered by any section, or maps beyond the end of the file.
struct OffsetMappingError {
  MethodDescriptor method;
};
/// @brief The header is malformed or truncated, or is followed by extra sections.
struct UnsupportedBody {
  MethodDescriptor method;
  std::string reason;
  bool has_exception_handlers{ false };
};

using Error = std::variant<NoBody, OffsetMappingError, UnsupportedBody>;

}  // namespace locating

/// @brief Decodes the body header at the start of bytes. Does not reject headers with extra sections, callers decide.
[[nodiscard]] Result<BodyHeader, HeaderError> ReadBodyHeader(std::span<uint8_t const> bytes);

/// @brief Maps the method's RVA to a file offset and decodes the body header found there.
/// Bodies with extra sections are rejected, as is any span that does not fit inside the file.
[[nodiscard]] Result<LocatedBody, locating::Error> LocateBody(Module const& module, MethodDescriptor const& method);

}  // namespace ilweave

template <>
class fmt::formatter<ilweave::BodyEncoding> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::BodyEncoding const& encoding, Context& ctx) const {
    switch (encoding) {
      case ilweave::BodyEncoding::Tiny:
        return format_to(ctx.out(), "tiny");
      case ilweave::BodyEncoding::Fat:
        return format_to(ctx.out(), "fat");
    }
    return format_to(ctx.out(), "unknown");
  }
};

template <>
class fmt::formatter<ilweave::BodyHeader> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::BodyHeader const& header, Context& ctx) const {
    return format_to(ctx.out(), "{} header ({} bytes), code: {} bytes, flags: {:#x}{}", header.encoding,
                     header.header_size, header.code_size, header.flags,
                     header.more_sects ? ", more sections" : "");
  }
};

// Custom formatter for ilweave::locating::Error
template <>
class fmt::formatter<ilweave::locating::Error> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::locating::Error const& error, Context& ctx) const {
    using namespace ilweave::locating;
    return std::visit(
        ilweave::util::overload{
          [&ctx](NoBody const& no_body) {
            return fmt::format_to(ctx.out(), "Method has no body: {}", no_body.method);
          },
          [&ctx](OffsetMappingError const& mapping) {
            return fmt::format_to(ctx.out(), "Method RVA does not map into the file: {}", mapping.method);
          },
          [&ctx](UnsupportedBody const& unsupported) {
            return fmt::format_to(ctx.out(), "Unsupported body{}: {} for method: {}",
                                  unsupported.has_exception_handlers ? " (has exception handlers)" : "",
                                  unsupported.reason, unsupported.method);
          } },
        error);
  }
};
