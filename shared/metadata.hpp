#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>

#include "calling-convention.hpp"
#include "pe-image.hpp"
#include "return-category.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief The decoded parts of a MethodDefSig (II.23.2.1) the patcher cares about.
struct MethodSignature {
  CallingConvention convention{ CallingConvention::Default };
  bool has_this{ false };
  uint32_t generic_arity{ 0 };
  uint32_t param_count{ 0 };
  /// @brief The element type byte of the return type after custom modifiers, or 0 if the blob could not be decoded.
  uint8_t return_element{ 0 };
  ReturnCategory return_category{ ReturnCategory::Unsupported };

  /// @brief Decodes a method signature blob. Malformed blobs yield std::nullopt.
  [[nodiscard]] static std::optional<MethodSignature> Decode(std::span<uint8_t const> blob);
};

/// @brief One row of the MethodDef table, with its name and signature resolved.
struct MethodRow {
  uint32_t row{};
  uint32_t rva{};
  uint16_t impl_flags{};
  uint16_t flags{};
  std::string name;
  /// @brief std::nullopt if the signature blob was missing or malformed.
  std::optional<MethodSignature> signature;
};

/// @brief One row of the TypeDef table.
struct TypeEntry {
  uint32_t row{};
  std::string namespaze;
  std::string name;
  /// @brief Namespace.Name, or just Name for types in the global namespace.
  std::string full_name;
  /// @brief MethodDef rows owned by this type, in declaration order (MethodPtr indirection already applied).
  std::vector<uint32_t> method_rows;
};

/// @brief Identifies a method for the patch pipeline. Built from a TypeEntry and a MethodRow.
struct MethodDescriptor {
  std::string type_name;
  std::string name;
  uint32_t token{};
  uint32_t rva{};
  uint16_t flags{};
  bool is_static{ false };
  uint32_t param_count{ 0 };
  uint32_t generic_arity{ 0 };
  CallingConvention convention{ CallingConvention::Default };
  ReturnCategory return_category{ ReturnCategory::Unsupported };
};

/// @brief The ECMA-335 metadata of a module, parsed eagerly into owned rows.
/// Only the tables needed to resolve types and methods (0x00 through 0x06) are decoded; the row counts of every
/// present table are kept so coded index widths are computed correctly.
struct Metadata {
  constexpr static uint32_t kMethodDefTokenType = 0x06000000;

  std::string version;
  std::string table_stream_name;
  std::array<uint32_t, 64> row_counts{};
  uint8_t heap_sizes{ 0 };
  std::vector<TypeEntry> types{};
  std::vector<MethodRow> methods{};

  /// @brief Returns the MethodDef row (1 based), or nullptr if out of range.
  [[nodiscard]] MethodRow const* Method(uint32_t row) const {
    if (row == 0 || row > methods.size()) return nullptr;
    return &methods[row - 1];
  }

  /// @brief Parses the CLI header, metadata root, streams and the type/method tables.
  [[nodiscard]] static Result<Metadata, ParseError> Parse(std::span<uint8_t const> bytes, PeImage const& image);
};

/// @brief Combines a type and one of its method rows into a descriptor.
[[nodiscard]] MethodDescriptor DescribeMethod(TypeEntry const& type, MethodRow const& method);

}  // namespace ilweave

template <>
class fmt::formatter<ilweave::MethodDescriptor> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::MethodDescriptor const& method, Context& ctx) const {
    return format_to(ctx.out(), "{}::{} (token: {:#010x}, rva: {:#x}, {}, params: {}, returns: {})", method.type_name,
                     method.name, method.token, method.rva, method.is_static ? "static" : "instance",
                     method.param_count, method.return_category);
  }
};
