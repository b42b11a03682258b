#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

namespace ilweave {

/// @brief Bounds checked little-endian view over a byte buffer.
/// All reads return std::nullopt when they would run past the end, so callers can fail closed on truncated input.
struct ByteView {
  std::span<uint8_t const> bytes;

  template <class T>
    requires(std::is_trivially_copyable_v<T>)
  [[nodiscard]] std::optional<T> Read(std::size_t offset) const {
    if (offset > bytes.size() || bytes.size() - offset < sizeof(T)) return std::nullopt;
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
  }

  /// @brief Reads a 2 or 4 byte index, as used by metadata heap and table references.
  [[nodiscard]] std::optional<uint32_t> ReadIndex(std::size_t offset, std::size_t width) const {
    if (width == 2) {
      auto v = Read<uint16_t>(offset);
      if (!v) return std::nullopt;
      return *v;
    }
    return Read<uint32_t>(offset);
  }

  [[nodiscard]] std::optional<std::span<uint8_t const>> Slice(std::size_t offset, std::size_t size) const {
    if (offset > bytes.size() || bytes.size() - offset < size) return std::nullopt;
    return bytes.subspan(offset, size);
  }

  /// @brief Reads a NUL terminated string starting at offset. Fails if no terminator exists before the end.
  [[nodiscard]] std::optional<std::string_view> ReadCString(std::size_t offset) const {
    if (offset >= bytes.size()) return std::nullopt;
    auto const* start = reinterpret_cast<char const*>(bytes.data() + offset);
    auto const* end = static_cast<char const*>(std::memchr(start, '\0', bytes.size() - offset));
    if (end == nullptr) return std::nullopt;
    return std::string_view(start, static_cast<std::size_t>(end - start));
  }

  [[nodiscard]] std::size_t size() const {
    return bytes.size();
  }
};

/// @brief Sequential cursor over a signature blob (II.23.2).
struct BlobCursor {
  std::span<uint8_t const> blob;
  std::size_t pos{ 0 };

  [[nodiscard]] bool empty() const {
    return pos >= blob.size();
  }
  [[nodiscard]] std::optional<uint8_t> Peek() const {
    if (empty()) return std::nullopt;
    return blob[pos];
  }
  std::optional<uint8_t> ReadByte() {
    if (empty()) return std::nullopt;
    return blob[pos++];
  }
  /// @brief Decodes an ECMA-335 compressed unsigned integer (1, 2 or 4 bytes, big-endian).
  std::optional<uint32_t> ReadCompressed() {
    auto first = ReadByte();
    if (!first) return std::nullopt;
    if ((*first & 0x80U) == 0) return *first;
    if ((*first & 0xC0U) == 0x80U) {
      auto second = ReadByte();
      if (!second) return std::nullopt;
      return ((*first & 0x3FU) << 8U) | *second;
    }
    if ((*first & 0xE0U) == 0xC0U) {
      uint32_t value = *first & 0x1FU;
      for (int i = 0; i < 3; i++) {
        auto next = ReadByte();
        if (!next) return std::nullopt;
        value = (value << 8U) | *next;
      }
      return value;
    }
    return std::nullopt;
  }
};

/// @brief Decodes the compressed length prefix of a #Blob heap entry and returns the entry contents.
[[nodiscard]] inline std::optional<std::span<uint8_t const>> BlobAt(std::span<uint8_t const> heap, uint32_t index) {
  if (index >= heap.size()) return std::nullopt;
  BlobCursor cursor{ heap.subspan(index) };
  auto length = cursor.ReadCompressed();
  if (!length) return std::nullopt;
  auto const start = index + cursor.pos;
  if (heap.size() - start < *length) return std::nullopt;
  return heap.subspan(start, *length);
}

}  // namespace ilweave
