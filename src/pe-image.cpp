#include "pe-image.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "byte-reader.hpp"
#include "ecma335.hpp"
#include "util.hpp"

namespace {
using namespace ilweave;
using ResultT = Result<PeImage, ParseError>;

constexpr uint32_t kLfanewOffset = 0x3C;
// Offsets of NumberOfRvaAndSizes within the optional header
constexpr uint32_t kPe32RvaCountOffset = 92;
constexpr uint32_t kPe32PlusRvaCountOffset = 108;

}  // namespace

namespace ilweave {

std::optional<uint32_t> PeImage::RvaToOffset(uint32_t rva) const {
  auto const* section = SectionFor(rva);
  if (section == nullptr) return std::nullopt;
  return rva - section->virtual_address + section->pointer_to_raw_data;
}

SectionHeader const* PeImage::SectionFor(uint32_t rva) const {
  auto it = std::find_if(sections.begin(), sections.end(), [rva](SectionHeader const& s) { return s.Contains(rva); });
  return it == sections.end() ? nullptr : &*it;
}

Result<PeImage, ParseError> PeImage::Parse(std::span<uint8_t const> bytes) {
  ByteView view{ bytes };
  auto dos_magic = view.Read<uint16_t>(0);
  if (!dos_magic || *dos_magic != ecma::kDosSignature) {
    return ResultT::Err(ParseError{ "missing DOS signature" });
  }
  auto lfanew = view.Read<uint32_t>(kLfanewOffset);
  if (!lfanew) {
    return ResultT::Err(ParseError{ "truncated DOS header" });
  }
  auto pe_magic = view.Read<uint32_t>(*lfanew);
  if (!pe_magic || *pe_magic != ecma::kPeSignature) {
    return ResultT::Err(ParseError{ fmt::format("missing PE signature at offset {:#x}", *lfanew) });
  }

  PeImage image{};
  auto const coff = static_cast<std::size_t>(*lfanew) + 4;
  auto machine = view.Read<uint16_t>(coff);
  auto num_sections = view.Read<uint16_t>(coff + 2);
  auto optional_size = view.Read<uint16_t>(coff + 16);
  if (!machine || !num_sections || !optional_size) {
    return ResultT::Err(ParseError{ "truncated COFF header" });
  }
  image.machine = *machine;

  auto const optional = coff + kCoffHeaderSize;
  auto magic = view.Read<uint16_t>(optional);
  if (!magic) {
    return ResultT::Err(ParseError{ "truncated optional header" });
  }
  uint32_t rva_count_offset{};
  if (*magic == ecma::kPe32Magic) {
    rva_count_offset = kPe32RvaCountOffset;
  } else if (*magic == ecma::kPe32PlusMagic) {
    rva_count_offset = kPe32PlusRvaCountOffset;
    image.is_pe32_plus = true;
  } else {
    return ResultT::Err(ParseError{ fmt::format("unknown optional header magic {:#x}", *magic) });
  }
  auto rva_count = view.Read<uint32_t>(optional + rva_count_offset);
  if (!rva_count) {
    return ResultT::Err(ParseError{ "truncated optional header" });
  }
  // Data directories immediately follow NumberOfRvaAndSizes, 8 bytes each
  if (*rva_count > ecma::kCliHeaderDirectory) {
    auto const dir = optional + rva_count_offset + 4 + ecma::kCliHeaderDirectory * 8;
    auto rva = view.Read<uint32_t>(dir);
    auto size = view.Read<uint32_t>(dir + 4);
    if (!rva || !size) {
      return ResultT::Err(ParseError{ "truncated data directories" });
    }
    image.cli_header = DataDirectory{ .rva = *rva, .size = *size };
  }

  auto const table = optional + *optional_size;
  image.sections.reserve(*num_sections);
  for (uint32_t i = 0; i < *num_sections; i++) {
    auto const entry = table + static_cast<std::size_t>(i) * kSectionHeaderSize;
    auto name = view.Slice(entry, 8);
    auto virtual_size = view.Read<uint32_t>(entry + 8);
    auto virtual_address = view.Read<uint32_t>(entry + 12);
    auto raw_size = view.Read<uint32_t>(entry + 16);
    auto raw_pointer = view.Read<uint32_t>(entry + 20);
    if (!name || !virtual_size || !virtual_address || !raw_size || !raw_pointer) {
      return ResultT::Err(ParseError{ fmt::format("truncated section table at entry {}", i) });
    }
    // Section names are padded with NULs but need not be terminated when all 8 bytes are used
    auto const* chars = reinterpret_cast<char const*>(name->data());
    image.sections.push_back(SectionHeader{
      .name = std::string(chars, strnlen(chars, name->size())),
      .virtual_size = *virtual_size,
      .virtual_address = *virtual_address,
      .size_of_raw_data = *raw_size,
      .pointer_to_raw_data = *raw_pointer,
    });
    ILWEAVE_DEBUG("Section {}: {}", i, image.sections.back());
  }
  return ResultT::Ok(std::move(image));
}

}  // namespace ilweave
