#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <fmt/format.h>

#include "util.hpp"

namespace ilweave {

/// @brief A structural failure while parsing the container or its metadata. Holds a human readable reason.
struct ParseError {
  std::string reason;
};

struct DataDirectory {
  uint32_t rva{};
  uint32_t size{};
};

/// @brief One entry of the PE section table (IMAGE_SECTION_HEADER, 40 bytes on disk).
struct SectionHeader {
  std::string name;
  uint32_t virtual_size{};
  uint32_t virtual_address{};
  uint32_t size_of_raw_data{};
  uint32_t pointer_to_raw_data{};

  /// @brief Returns true if the RVA lies within this section's mapped range.
  /// The range extends to the larger of the virtual and raw sizes; some linkers leave VirtualSize as zero.
  [[nodiscard]] bool Contains(uint32_t rva) const {
    auto const extent = std::max(virtual_size, size_of_raw_data);
    return rva >= virtual_address && rva - virtual_address < extent;
  }
};

/// @brief The parts of a PE image the patcher needs: the section table and the CLI header directory.
struct PeImage {
  constexpr static uint32_t kSectionHeaderSize = 40;
  constexpr static uint32_t kCoffHeaderSize = 20;

  bool is_pe32_plus{ false };
  uint16_t machine{};
  std::vector<SectionHeader> sections{};
  DataDirectory cli_header{};

  /// @brief Maps an RVA to a file offset by walking the section table.
  /// Returns std::nullopt if no section contains the RVA.
  [[nodiscard]] std::optional<uint32_t> RvaToOffset(uint32_t rva) const;

  /// @brief Returns the section containing the given RVA, if any.
  [[nodiscard]] SectionHeader const* SectionFor(uint32_t rva) const;

  /// @brief Parses the DOS stub, PE signature, COFF header, optional header and section table.
  [[nodiscard]] static Result<PeImage, ParseError> Parse(std::span<uint8_t const> bytes);
};

}  // namespace ilweave

template <>
class fmt::formatter<ilweave::SectionHeader> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::SectionHeader const& section, Context& ctx) const {
    return format_to(ctx.out(), "{} (va: {:#x}, vsize: {:#x}, raw: {:#x}, rawsize: {:#x})", section.name,
                     section.virtual_address, section.virtual_size, section.pointer_to_raw_data,
                     section.size_of_raw_data);
  }
};
