#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <fmt/format.h>

#include "metadata.hpp"
#include "pe-image.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief Reported when a module cannot be opened: missing file, read failure, or a container/metadata parse error.
struct OpenError {
  std::string path;
  std::string reason;
};

/// @brief A loaded CLI module. Owns the file bytes together with the section table and metadata parsed from them.
/// Read only once constructed.
struct Module {
  Module(Module&&) = default;
  Module& operator=(Module&&) = default;
  Module(Module const&) = delete;
  Module& operator=(Module const&) = delete;

  /// @brief Reads the whole file at path (closing it before parsing) and parses it.
  [[nodiscard]] static Result<Module, OpenError> Open(std::string const& path);
  /// @brief Parses an in-memory module. origin is only used to label errors.
  [[nodiscard]] static Result<Module, OpenError> FromBytes(std::vector<uint8_t> bytes, std::string origin);

  /// @brief Finds a type by its qualified name (Namespace.Name). Ordinal comparison.
  [[nodiscard]] std::optional<TypeEntry> FindType(std::string_view full_name) const;
  /// @brief Finds a method by name on the given type. When overloads share the name, the first declared wins.
  [[nodiscard]] std::optional<MethodDescriptor> FindMethod(TypeEntry const& type, std::string_view name) const;

  [[nodiscard]] std::vector<TypeEntry> const& Types() const {
    return metadata_.types;
  }
  /// @brief All methods declared on the given type, in declaration order.
  [[nodiscard]] std::vector<MethodDescriptor> Methods(TypeEntry const& type) const;

  [[nodiscard]] std::span<uint8_t const> bytes() const {
    return bytes_;
  }
  [[nodiscard]] PeImage const& image() const {
    return image_;
  }
  [[nodiscard]] Metadata const& metadata() const {
    return metadata_;
  }
  [[nodiscard]] std::string const& origin() const {
    return origin_;
  }
  /// @brief Releases the owned bytes, leaving the module unusable.
  [[nodiscard]] std::vector<uint8_t> TakeBytes() && {
    return std::move(bytes_);
  }

 private:
  Module(std::vector<uint8_t> bytes, PeImage image, Metadata metadata, std::string origin)
      : bytes_(std::move(bytes)), image_(std::move(image)), metadata_(std::move(metadata)), origin_(std::move(origin)) {}

  std::vector<uint8_t> bytes_;
  PeImage image_;
  Metadata metadata_;
  std::string origin_;
};

}  // namespace ilweave

template <>
class fmt::formatter<ilweave::OpenError> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::OpenError const& error, Context& ctx) const {
    return format_to(ctx.out(), "Failed to open module: {}: {}", error.path, error.reason);
  }
};
