#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>
#include <fmt/format.h>

#include "return-category.hpp"
#include "util.hpp"

namespace ilweave {

/// @brief The largest code size a tiny header can describe (six bits).
constexpr static uint32_t kTinyHeaderMaxCode = 63;

namespace encoding {

/// @brief No default-return sequence exists for the category.
struct UnsupportedReturn {
  ReturnCategory category;
};
/// @brief The sequence does not fit in a tiny header.
struct BodyTooLarge {
  std::size_t code_size;
};

using Error = std::variant<UnsupportedReturn, BodyTooLarge>;

}  // namespace encoding

/// @brief Emits the CIL that returns the default value of the category (no header).
/// Returns an empty vector for ReturnCategory::Unsupported.
[[nodiscard]] std::vector<uint8_t> DefaultReturnSequence(ReturnCategory category);

/// @brief Wraps a code sequence in a tiny header. Fails with BodyTooLarge past kTinyHeaderMaxCode bytes.
[[nodiscard]] Result<std::vector<uint8_t>, encoding::Error> WrapTinyBody(std::vector<uint8_t> const& code);

/// @brief Builds a complete method body (tiny header followed by code) returning the default value of the category.
[[nodiscard]] Result<std::vector<uint8_t>, encoding::Error> EncodeDefaultBody(ReturnCategory category);

}  // namespace ilweave

// Custom formatter for ilweave::encoding::Error
template <>
class fmt::formatter<ilweave::encoding::Error> {
 public:
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }
  template <typename Context>
  constexpr auto format(ilweave::encoding::Error const& error, Context& ctx) const {
    using namespace ilweave::encoding;
    return std::visit(ilweave::util::overload{
                        [&ctx](UnsupportedReturn const& unsupported) {
                          return fmt::format_to(ctx.out(), "No default body for return category: {}",
                                                unsupported.category);
                        },
                        [&ctx](BodyTooLarge const& too_large) {
                          return fmt::format_to(ctx.out(), "Body of {} bytes does not fit a tiny header (max: {})",
                                                too_large.code_size, ilweave::kTinyHeaderMaxCode);
                        } },
                      error);
  }
};
