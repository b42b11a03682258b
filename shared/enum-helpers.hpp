#pragma once
#include <cstdint>
#include <type_traits>

namespace ilweave::enum_helpers {

/// @brief Checks if any bit of a raw on-disk mask (heap sizes, method attributes, body header flags) is set.
template <auto mask>
requires(std::is_integral_v<decltype(mask)>) constexpr bool HasBit(auto value) noexcept {
    return (static_cast<uint32_t>(value) & static_cast<uint32_t>(mask)) != 0;
}

}  // namespace ilweave::enum_helpers
