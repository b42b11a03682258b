#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <fmt/format.h>

#include "body-encoder.hpp"
#include "metadata.hpp"
#include "method-body.hpp"
#include "module.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief Describes one offline patch: which method of which module to replace, and where to write the result.
struct PatchRequest {
  std::filesystem::path module_path;
  std::filesystem::path output_path;
  std::string type_name;
  std::string method_name;
};

/// @brief Describes a patch that was applied.
struct PatchSummary {
  MethodDescriptor method;
  uint32_t file_offset{};
  /// @brief The header of the body that was replaced.
  BodyHeader original{};
  /// @brief header_size + code_size of the replaced body, all of which was rewritten.
  uint32_t span{};
  /// @brief Bytes of synthesized body at the start of the span; the rest of the span is zero filled.
  uint32_t encoded_size{};
};

namespace patching {

struct TypeNotFound {
  std::string type_name;
};
struct MethodNotFound {
  std::string type_name;
  std::string method_name;
};
using locating::NoBody;
using locating::OffsetMappingError;
using locating::UnsupportedBody;
/// @brief The method's return type has no default-return body.
struct UnsupportedReturn {
  MethodDescriptor method;
};
/// @brief The synthesized body does not fit in the located span, or in a tiny header.
struct BodyTooLarge {
  MethodDescriptor method;
  std::size_t encoded_size;
  std::size_t available;
};
/// @brief Creating, writing or renaming the output failed.
struct IoError {
  std::string path;
  std::string reason;
};

using Error = std::variant<TypeNotFound, MethodNotFound, NoBody, OffsetMappingError, UnsupportedBody,
                           UnsupportedReturn, BodyTooLarge, OpenError, IoError>;

using Result = ilweave::Result<PatchSummary, Error>;

}  // namespace patching

/// @brief Resolves and patches a method inside an in-memory module image.
/// The buffer is only modified on success; its size never changes.
[[nodiscard]] patching::Result PatchImage(std::vector<uint8_t>& bytes, std::string_view type_name,
                                          std::string_view method_name);

/// @brief Patches a method of an already opened module into the caller provided copy of its bytes.
/// out must hold the same bytes as module.bytes(); a buffer of a different size fails with IoError.
[[nodiscard]] patching::Result PatchModule(Module const& module, std::string_view type_name,
                                           std::string_view method_name, std::span<uint8_t> out);

/// @brief Reads request.module_path, replaces the method's body with a default-return body and writes the whole image to
/// request.output_path. Missing parent directories are created. No output is written when any step fails.
[[nodiscard]] patching::Result PatchMethod(PatchRequest const& request);

}  // namespace ilweave

// Custom formatter for ilweave::patching::Error
template <>
class fmt::formatter<ilweave::patching::Error> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::patching::Error const& error, Context& ctx) const {
    using namespace ilweave::patching;
    return std::visit(
        ilweave::util::overload{
          [&ctx](TypeNotFound const& not_found) {
            return fmt::format_to(ctx.out(), "Type not found: {}", not_found.type_name);
          },
          [&ctx](MethodNotFound const& not_found) {
            return fmt::format_to(ctx.out(), "Method not found: {} on type: {}", not_found.method_name,
                                  not_found.type_name);
          },
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
          },
          [&ctx](UnsupportedReturn const& unsupported) {
            return fmt::format_to(ctx.out(), "Unsupported return type for method: {}", unsupported.method);
          },
          [&ctx](BodyTooLarge const& too_large) {
            return fmt::format_to(ctx.out(), "Replacement body needs: {} bytes but only: {} are available for method: {}",
                                  too_large.encoded_size, too_large.available, too_large.method);
          },
          [&ctx](ilweave::OpenError const& open) { return fmt::format_to(ctx.out(), "{}", open); },
          [&ctx](IoError const& io) {
            return fmt::format_to(ctx.out(), "Failed to write output: {}: {}", io.path, io.reason);
          } },
        error);
  }
};
