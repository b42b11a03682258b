#include "method-body.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

#include "byte-reader.hpp"
#include "ecma335.hpp"
#include "enum-helpers.hpp"
#include "util.hpp"

namespace ilweave {

Result<BodyHeader, HeaderError> ReadBodyHeader(std::span<uint8_t const> bytes) {
  using ResultT = Result<BodyHeader, HeaderError>;
  ByteView view{ bytes };
  auto first = view.Read<uint8_t>(0);
  if (!first) {
    return ResultT::Err(HeaderError{ "no bytes at the body offset" });
  }
  if ((*first & ecma::kFormatMask) == ecma::kTinyFormat) {
    return ResultT::Ok(BodyHeader{
      .encoding = BodyEncoding::Tiny,
      .header_size = 1,
      .code_size = static_cast<uint32_t>(*first >> 2U),
    });
  }
  if ((*first & ecma::kFormatMask) != ecma::kFatFormat) {
    return ResultT::Err(HeaderError{ fmt::format("unknown header format bits in {:#04x}", *first) });
  }
  // Fat: flags (12 bits) and size in dwords (4 bits), max stack (2), code size (4), local var sig token (4)
  auto word = view.Read<uint16_t>(0);
  auto code_size = view.Read<uint32_t>(4);
  if (!word || !code_size || view.size() < kFatHeaderSize) {
    return ResultT::Err(HeaderError{ "truncated fat header" });
  }
  uint32_t const header_size = static_cast<uint32_t>(*word >> 12U) * 4;
  if (header_size < kFatHeaderSize) {
    return ResultT::Err(HeaderError{ fmt::format("fat header size {} is below the minimum of {}", header_size,
                                                 kFatHeaderSize) });
  }
  if (*code_size > std::numeric_limits<uint32_t>::max() - header_size) {
    return ResultT::Err(HeaderError{ fmt::format("fat code size {:#x} overflows the body span", *code_size) });
  }
  uint16_t const flags = *word & ecma::kFatFlagsMask;
  return ResultT::Ok(BodyHeader{
    .encoding = BodyEncoding::Fat,
    .header_size = header_size,
    .code_size = *code_size,
    .flags = flags,
    .more_sects = enum_helpers::HasBit<ecma::kFatMoreSects>(flags),
  });
}

Result<LocatedBody, locating::Error> LocateBody(Module const& module, MethodDescriptor const& method) {
  using ResultT = Result<LocatedBody, locating::Error>;
  if (method.rva == 0) {
    return ResultT::ErrAt<locating::NoBody>(locating::NoBody{ method });
  }
  auto offset = module.image().RvaToOffset(method.rva);
  auto const bytes = module.bytes();
  if (!offset || *offset >= bytes.size()) {
    return ResultT::ErrAt<locating::OffsetMappingError>(locating::OffsetMappingError{ method });
  }
  auto header = ReadBodyHeader(bytes.subspan(*offset));
  if (!header.has_value()) {
    return ResultT::ErrAt<locating::UnsupportedBody>(locating::UnsupportedBody{ method, header.error().reason, false });
  }
  auto const& decoded = header.value();
  if (decoded.more_sects) {
    return ResultT::ErrAt<locating::UnsupportedBody>(
        locating::UnsupportedBody{ method, "body is followed by extra data sections", true });
  }
  auto const available = bytes.size() - *offset;
  if (decoded.header_size > available || decoded.code_size > available - decoded.header_size) {
    return ResultT::ErrAt<locating::UnsupportedBody>(locating::UnsupportedBody{
        method,
        fmt::format("body at {:#x} with header {:#x} and code {:#x} extends past the end of the file", *offset,
                    decoded.header_size, decoded.code_size),
        false });
  }
  ILWEAVE_DEBUG("Located body of {} at {:#x}: {}", method, *offset, decoded);
  return ResultT::Ok(LocatedBody{ .file_offset = *offset, .header = decoded });
}

}  // namespace ilweave
