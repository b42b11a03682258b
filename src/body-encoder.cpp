#include "body-encoder.hpp"
#include <cstdint>
#include <utility>
#include <vector>

#include "ecma335.hpp"
#include "util.hpp"

namespace ilweave {

std::vector<uint8_t> DefaultReturnSequence(ReturnCategory category) {
  using namespace ecma::op;
  switch (category) {
    case ReturnCategory::Void:
      return { kRet };
    case ReturnCategory::Int32:
      return { kLdcI4_0, kRet };
    case ReturnCategory::Int64:
      return { kLdcI4_0, kConvI8, kRet };
    case ReturnCategory::NativeInt:
      return { kLdcI4_0, kConvI, kRet };
    case ReturnCategory::Float32:
      return { kLdcI4_0, kConvR4, kRet };
    case ReturnCategory::Float64:
      return { kLdcI4_0, kConvR8, kRet };
    case ReturnCategory::Reference:
      return { kLdnull, kRet };
    case ReturnCategory::Unsupported:
      break;
  }
  return {};
}

Result<std::vector<uint8_t>, encoding::Error> WrapTinyBody(std::vector<uint8_t> const& code) {
  using ResultT = Result<std::vector<uint8_t>, encoding::Error>;
  if (code.size() > kTinyHeaderMaxCode) {
    return ResultT::ErrAt<encoding::BodyTooLarge>(encoding::BodyTooLarge{ code.size() });
  }
  std::vector<uint8_t> body;
  body.reserve(code.size() + 1);
  body.push_back(static_cast<uint8_t>((code.size() << 2U) | ecma::kTinyFormat));
  body.insert(body.end(), code.begin(), code.end());
  return ResultT::Ok(std::move(body));
}

Result<std::vector<uint8_t>, encoding::Error> EncodeDefaultBody(ReturnCategory category) {
  auto code = DefaultReturnSequence(category);
  if (code.empty()) {
    return Result<std::vector<uint8_t>, encoding::Error>::ErrAt<encoding::UnsupportedReturn>(
        encoding::UnsupportedReturn{ category });
  }
  return WrapTinyBody(code);
}

}  // namespace ilweave
