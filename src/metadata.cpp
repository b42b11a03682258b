#include "metadata.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "byte-reader.hpp"
#include "ecma335.hpp"
#include "enum-helpers.hpp"
#include "util.hpp"

namespace {
using namespace ilweave;
using ResultT = Result<Metadata, ParseError>;

// Offset of the MetaData data directory inside the CLI header (after cb and the runtime version)
constexpr std::size_t kCliMetadataOffset = 8;
// Offset of the version length inside the metadata root
constexpr std::size_t kRootVersionLengthOffset = 12;
constexpr std::size_t kRootVersionOffset = 16;
// Offset of the first row count inside the #~ stream
constexpr std::size_t kTableRowCountsOffset = 24;

constexpr std::size_t AlignUp4(std::size_t value) {
  return (value + 3U) & ~static_cast<std::size_t>(3U);
}

struct StreamHeader {
  std::span<uint8_t const> data;
  std::string name;
};

/// @brief Computes column widths for the #~ tables from the heap size flags and row counts (II.24.2.6).
struct TableLayout {
  std::array<uint32_t, 64> const& rows;
  uint8_t heap_sizes;

  [[nodiscard]] std::size_t StringIndex() const {
    return enum_helpers::HasBit<ecma::kHeapStringsWide>(heap_sizes) ? 4 : 2;
  }
  [[nodiscard]] std::size_t GuidIndex() const {
    return enum_helpers::HasBit<ecma::kHeapGuidWide>(heap_sizes) ? 4 : 2;
  }
  [[nodiscard]] std::size_t BlobIndex() const {
    return enum_helpers::HasBit<ecma::kHeapBlobWide>(heap_sizes) ? 4 : 2;
  }
  [[nodiscard]] std::size_t TableIndex(uint8_t table) const {
    return rows[table] < 0x10000U ? 2 : 4;
  }
  [[nodiscard]] std::size_t CodedIndex(std::initializer_list<uint8_t> tables, uint32_t tag_bits) const {
    uint32_t max_rows = 0;
    for (auto table : tables) {
      max_rows = std::max(max_rows, rows[table]);
    }
    return max_rows < (1U << (16U - tag_bits)) ? 2 : 4;
  }
  [[nodiscard]] std::size_t ResolutionScope() const {
    using namespace ecma::table;
    return CodedIndex({ kModule, kModuleRef, kAssemblyRef, kTypeRef }, 2);
  }
  [[nodiscard]] std::size_t TypeDefOrRef() const {
    using namespace ecma::table;
    return CodedIndex({ kTypeDef, kTypeRef, kTypeSpec }, 2);
  }

  /// @brief Row size of the tables that precede (and include) MethodDef.
  [[nodiscard]] std::size_t RowSize(uint8_t table) const {
    using namespace ecma::table;
    switch (table) {
      case kModule:
        return 2 + StringIndex() + 3 * GuidIndex();
      case kTypeRef:
        return ResolutionScope() + 2 * StringIndex();
      case kTypeDef:
        return 4 + 2 * StringIndex() + TypeDefOrRef() + TableIndex(kField) + TableIndex(kMethodDef);
      case kFieldPtr:
        return TableIndex(kField);
      case kField:
        return 2 + StringIndex() + BlobIndex();
      case kMethodPtr:
        return TableIndex(kMethodDef);
      case kMethodDef:
        return 4 + 2 + 2 + StringIndex() + BlobIndex() + TableIndex(kParam);
      default:
        ILWEAVE_ABORT("Row size requested for unsupported table: {:#x}", table);
    }
  }
};

Result<std::vector<StreamHeader>, ParseError> read_stream_headers(ByteView root) {
  using StreamResult = Result<std::vector<StreamHeader>, ParseError>;
  auto version_length = root.Read<uint32_t>(kRootVersionLengthOffset);
  if (!version_length) {
    return StreamResult::Err(ParseError{ "truncated metadata root" });
  }
  auto pos = kRootVersionOffset + AlignUp4(*version_length);
  auto stream_count = root.Read<uint16_t>(pos + 2);
  if (!stream_count) {
    return StreamResult::Err(ParseError{ "truncated metadata root" });
  }
  pos += 4;
  std::vector<StreamHeader> streams;
  streams.reserve(*stream_count);
  for (uint16_t i = 0; i < *stream_count; i++) {
    auto offset = root.Read<uint32_t>(pos);
    auto size = root.Read<uint32_t>(pos + 4);
    auto name = root.ReadCString(pos + 8);
    if (!offset || !size || !name) {
      return StreamResult::Err(ParseError{ fmt::format("truncated stream header {}", i) });
    }
    auto data = root.Slice(*offset, *size);
    if (!data) {
      return StreamResult::Err(
          ParseError{ fmt::format("stream {} ({:#x}+{:#x}) lies outside the metadata root", *name, *offset, *size) });
    }
    streams.push_back(StreamHeader{ .data = *data, .name = std::string(*name) });
    pos += 8 + AlignUp4(name->size() + 1);
  }
  return StreamResult::Ok(std::move(streams));
}

std::optional<std::span<uint8_t const>> find_stream(std::vector<StreamHeader> const& streams,
                                                    std::initializer_list<std::string_view> names) {
  for (auto const& stream : streams) {
    for (auto name : names) {
      if (stream.name == name) return stream.data;
    }
  }
  return std::nullopt;
}

}  // namespace

namespace ilweave {

ReturnCategory CategoryForElementType(uint8_t element, bool generic_of_value_type) {
  switch (element) {
    case ecma::et::kVoid:
      return ReturnCategory::Void;
    case ecma::et::kBoolean:
    case ecma::et::kChar:
    case ecma::et::kI1:
    case ecma::et::kU1:
    case ecma::et::kI2:
    case ecma::et::kU2:
    case ecma::et::kI4:
    case ecma::et::kU4:
      return ReturnCategory::Int32;
    case ecma::et::kI8:
    case ecma::et::kU8:
      return ReturnCategory::Int64;
    case ecma::et::kI:
    case ecma::et::kU:
    case ecma::et::kPtr:
    case ecma::et::kByRef:
    case ecma::et::kFnPtr:
      return ReturnCategory::NativeInt;
    case ecma::et::kR4:
      return ReturnCategory::Float32;
    case ecma::et::kR8:
      return ReturnCategory::Float64;
    case ecma::et::kString:
    case ecma::et::kClass:
    case ecma::et::kObject:
    case ecma::et::kArray:
    case ecma::et::kSzArray:
      return ReturnCategory::Reference;
    case ecma::et::kGenericInst:
      return generic_of_value_type ? ReturnCategory::Unsupported : ReturnCategory::Reference;
    default:
      return ReturnCategory::Unsupported;
  }
}

std::optional<MethodSignature> MethodSignature::Decode(std::span<uint8_t const> blob) {
  BlobCursor cursor{ blob };
  auto conv = cursor.ReadByte();
  if (!conv) return std::nullopt;
  auto const kind = *conv & ecma::kSigKindMask;
  if (kind > static_cast<uint8_t>(CallingConvention::Vararg)) {
    // Field, local, property or generic instantiation signatures
    return std::nullopt;
  }
  MethodSignature sig{};
  sig.convention = static_cast<CallingConvention>(kind);
  sig.has_this = (*conv & ecma::kSigHasThis) != 0;
  if ((*conv & ecma::kSigGeneric) != 0) {
    auto arity = cursor.ReadCompressed();
    if (!arity) return std::nullopt;
    sig.generic_arity = *arity;
  }
  auto count = cursor.ReadCompressed();
  if (!count) return std::nullopt;
  sig.param_count = *count;
  // Skip custom modifiers on the return type: CMOD_OPT/CMOD_REQD followed by a TypeDefOrRefEncoded
  while (true) {
    auto peek = cursor.Peek();
    if (!peek) return std::nullopt;
    if (*peek != ecma::et::kCModOpt && *peek != ecma::et::kCModReqd) break;
    cursor.ReadByte();
    if (!cursor.ReadCompressed()) return std::nullopt;
  }
  auto element = cursor.ReadByte();
  if (!element) return std::nullopt;
  bool generic_of_value_type = false;
  if (*element == ecma::et::kGenericInst) {
    auto inner = cursor.Peek();
    if (!inner) return std::nullopt;
    generic_of_value_type = *inner == ecma::et::kValueType;
  }
  sig.return_element = *element;
  sig.return_category = CategoryForElementType(*element, generic_of_value_type);
  return sig;
}

MethodDescriptor DescribeMethod(TypeEntry const& type, MethodRow const& method) {
  MethodDescriptor descriptor{
    .type_name = type.full_name,
    .name = method.name,
    .token = Metadata::kMethodDefTokenType | method.row,
    .rva = method.rva,
    .flags = method.flags,
    .is_static = enum_helpers::HasBit<ecma::kMethodStatic>(method.flags),
  };
  if (method.signature) {
    descriptor.param_count = method.signature->param_count;
    descriptor.generic_arity = method.signature->generic_arity;
    descriptor.convention = method.signature->convention;
    descriptor.return_category = method.signature->return_category;
  }
  return descriptor;
}

Result<Metadata, ParseError> Metadata::Parse(std::span<uint8_t const> bytes, PeImage const& image) {
  ByteView file{ bytes };
  if (image.cli_header.rva == 0) {
    return ResultT::Err(ParseError{ "image has no CLI header (not a managed module)" });
  }
  auto cli_offset = image.RvaToOffset(image.cli_header.rva);
  if (!cli_offset) {
    return ResultT::Err(ParseError{ fmt::format("CLI header RVA {:#x} is not mapped by any section",
                                                image.cli_header.rva) });
  }
  auto metadata_rva = file.Read<uint32_t>(*cli_offset + kCliMetadataOffset);
  auto metadata_size = file.Read<uint32_t>(*cli_offset + kCliMetadataOffset + 4);
  if (!metadata_rva || !metadata_size) {
    return ResultT::Err(ParseError{ "truncated CLI header" });
  }
  auto metadata_offset = image.RvaToOffset(*metadata_rva);
  if (!metadata_offset) {
    return ResultT::Err(ParseError{ fmt::format("metadata RVA {:#x} is not mapped by any section", *metadata_rva) });
  }
  auto root_bytes = file.Slice(*metadata_offset, *metadata_size);
  if (!root_bytes) {
    return ResultT::Err(ParseError{ "metadata root extends past the end of the file" });
  }
  ByteView root{ *root_bytes };
  auto signature = root.Read<uint32_t>(0);
  if (!signature || *signature != ecma::kMetadataSignature) {
    return ResultT::Err(ParseError{ "bad metadata root signature" });
  }

  Metadata metadata{};
  if (auto version_length = root.Read<uint32_t>(kRootVersionLengthOffset)) {
    if (auto version = root.Slice(kRootVersionOffset, *version_length)) {
      auto const* chars = reinterpret_cast<char const*>(version->data());
      metadata.version = std::string(chars, strnlen(chars, version->size()));
    }
  }

  auto streams_result = read_stream_headers(root);
  if (!streams_result.has_value()) {
    return ResultT::Err(streams_result.error());
  }
  auto const& streams = streams_result.value();
  auto tables = find_stream(streams, { "#~", "#-" });
  auto strings = find_stream(streams, { "#Strings" });
  auto blobs = find_stream(streams, { "#Blob" });
  if (!tables) {
    return ResultT::Err(ParseError{ "missing #~ table stream" });
  }
  if (!strings || !blobs) {
    return ResultT::Err(ParseError{ "missing #Strings or #Blob heap" });
  }
  for (auto const& stream : streams) {
    if (stream.data.data() == tables->data()) metadata.table_stream_name = stream.name;
  }
  ILWEAVE_DEBUG("Metadata version: {} with {} streams, tables in {}", metadata.version, streams.size(),
                metadata.table_stream_name);

  // #~ header: reserved (4), major (1), minor (1), heap sizes (1), reserved (1), valid (8), sorted (8), rows...
  ByteView table_view{ *tables };
  auto heap_sizes = table_view.Read<uint8_t>(6);
  auto valid = table_view.Read<uint64_t>(8);
  if (!heap_sizes || !valid) {
    return ResultT::Err(ParseError{ "truncated table stream header" });
  }
  metadata.heap_sizes = *heap_sizes;
  auto pos = kTableRowCountsOffset;
  for (uint32_t table = 0; table < ecma::table::kCount; table++) {
    if ((*valid & (1ULL << table)) == 0) continue;
    auto count = table_view.Read<uint32_t>(pos);
    if (!count) {
      return ResultT::Err(ParseError{ "truncated table row counts" });
    }
    metadata.row_counts[table] = *count;
    pos += 4;
  }
  if (enum_helpers::HasBit<ecma::kHeapExtraData>(metadata.heap_sizes)) {
    pos += 4;
  }

  TableLayout layout{ metadata.row_counts, metadata.heap_sizes };
  std::array<std::size_t, ecma::table::kMethodDef + 1> table_offsets{};
  for (uint8_t table = 0; table <= ecma::table::kMethodDef; table++) {
    table_offsets[table] = pos;
    pos += static_cast<std::size_t>(metadata.row_counts[table]) * layout.RowSize(table);
  }
  if (pos > table_view.size()) {
    return ResultT::Err(ParseError{ fmt::format("table stream truncated: need {:#x} bytes, have {:#x}", pos,
                                                table_view.size()) });
  }

  ByteView string_heap{ *strings };
  auto read_string = [&](std::size_t offset) -> std::optional<std::string> {
    auto index = table_view.ReadIndex(offset, layout.StringIndex());
    if (!index) return std::nullopt;
    auto value = string_heap.ReadCString(*index);
    if (!value) return std::nullopt;
    return std::string(*value);
  };

  // MethodDef: RVA (4), ImplFlags (2), Flags (2), Name (string), Signature (blob), ParamList (Param index)
  auto const method_rows = metadata.row_counts[ecma::table::kMethodDef];
  auto const method_size = layout.RowSize(ecma::table::kMethodDef);
  metadata.methods.reserve(method_rows);
  for (uint32_t i = 0; i < method_rows; i++) {
    auto const row = table_offsets[ecma::table::kMethodDef] + i * method_size;
    auto name = read_string(row + 8);
    auto blob_index = table_view.ReadIndex(row + 8 + layout.StringIndex(), layout.BlobIndex());
    if (!name || !blob_index) {
      return ResultT::Err(ParseError{ fmt::format("MethodDef row {} has a bad name or signature index", i + 1) });
    }
    std::optional<MethodSignature> method_signature;
    if (auto blob = BlobAt(*blobs, *blob_index)) {
      method_signature = MethodSignature::Decode(*blob);
    }
    if (!method_signature) {
      ILWEAVE_DEBUG("MethodDef row {} ({}) has an undecodable signature", i + 1, *name);
    }
    metadata.methods.push_back(MethodRow{
      .row = i + 1,
      .rva = *table_view.Read<uint32_t>(row),
      .impl_flags = *table_view.Read<uint16_t>(row + 4),
      .flags = *table_view.Read<uint16_t>(row + 6),
      .name = std::move(*name),
      .signature = method_signature,
    });
  }

  // Uncompressed streams may route method lists through MethodPtr
  std::vector<uint32_t> method_ptrs;
  auto const ptr_rows = metadata.row_counts[ecma::table::kMethodPtr];
  for (uint32_t i = 0; i < ptr_rows; i++) {
    auto const row = table_offsets[ecma::table::kMethodPtr] + i * layout.RowSize(ecma::table::kMethodPtr);
    method_ptrs.push_back(*table_view.ReadIndex(row, layout.TableIndex(ecma::table::kMethodDef)));
  }
  auto const list_count = ptr_rows != 0 ? ptr_rows : method_rows;

  // TypeDef: Flags (4), TypeName, TypeNamespace, Extends (TypeDefOrRef), FieldList, MethodList
  auto const type_rows = metadata.row_counts[ecma::table::kTypeDef];
  auto const type_size = layout.RowSize(ecma::table::kTypeDef);
  auto const method_list_column =
      4 + 2 * layout.StringIndex() + layout.TypeDefOrRef() + layout.TableIndex(ecma::table::kField);
  auto method_list_at = [&](uint32_t type_row) -> uint32_t {
    if (type_row >= type_rows) return list_count + 1;
    auto const row = table_offsets[ecma::table::kTypeDef] + type_row * type_size;
    auto value = *table_view.ReadIndex(row + method_list_column, layout.TableIndex(ecma::table::kMethodDef));
    return std::clamp<uint32_t>(value, 1, list_count + 1);
  };
  metadata.types.reserve(type_rows);
  for (uint32_t i = 0; i < type_rows; i++) {
    auto const row = table_offsets[ecma::table::kTypeDef] + i * type_size;
    auto name = read_string(row + 4);
    auto namespaze = read_string(row + 4 + layout.StringIndex());
    if (!name || !namespaze) {
      return ResultT::Err(ParseError{ fmt::format("TypeDef row {} has a bad name index", i + 1) });
    }
    TypeEntry type{
      .row = i + 1,
      .namespaze = std::move(*namespaze),
      .name = std::move(*name),
    };
    type.full_name = type.namespaze.empty() ? type.name : fmt::format("{}.{}", type.namespaze, type.name);
    auto const begin = method_list_at(i);
    auto const end = std::max(begin, method_list_at(i + 1));
    for (auto index = begin; index < end; index++) {
      type.method_rows.push_back(ptr_rows != 0 ? method_ptrs[index - 1] : index);
    }
    metadata.types.push_back(std::move(type));
  }
  ILWEAVE_DEBUG("Parsed {} types and {} methods", metadata.types.size(), metadata.methods.size());
  return ResultT::Ok(std::move(metadata));
}

}  // namespace ilweave
