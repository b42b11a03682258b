#include "capi.h"
#include <fmt/compile.h>
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <variant>
#include "patcher.hpp"
#include "util.hpp"

namespace {

IlweavePatchErrorData* make_error_data(ilweave::patching::Error const& error) {
  return reinterpret_cast<IlweavePatchErrorData*>(new ilweave::patching::Error{ error });
}

IlweavePatchResult convert_patch_result(ilweave::patching::Result const& result) {
  using namespace ilweave::patching;
  if (result.has_value()) {
    auto const& summary = result.value();
    return IlweavePatchResult{
      .result = ILWEAVE_PATCH_OK,
      .value = { .info = { .file_offset = summary.file_offset,
                           .span = summary.span,
                           .encoded_size = summary.encoded_size } },
    };
  }
  auto const& error = result.error();
  // Convert the error to an IlweavePatchResultType
  auto result_type = std::visit(ilweave::util::overload{
                                  [](TypeNotFound const&) { return ILWEAVE_PATCH_TYPE_NOT_FOUND; },
                                  [](MethodNotFound const&) { return ILWEAVE_PATCH_METHOD_NOT_FOUND; },
                                  [](NoBody const&) { return ILWEAVE_PATCH_NO_BODY; },
                                  [](OffsetMappingError const&) { return ILWEAVE_PATCH_OFFSET_MAPPING_ERROR; },
                                  [](UnsupportedBody const&) { return ILWEAVE_PATCH_UNSUPPORTED_BODY; },
                                  [](UnsupportedReturn const&) { return ILWEAVE_PATCH_UNSUPPORTED_RETURN; },
                                  [](BodyTooLarge const&) { return ILWEAVE_PATCH_BODY_TOO_LARGE; },
                                  [](ilweave::OpenError const&) { return ILWEAVE_PATCH_OPEN_ERROR; },
                                  [](IoError const&) { return ILWEAVE_PATCH_IO_ERROR; },
                                },
                                error);
  return IlweavePatchResult{
    .result = result_type,
    .value = { .data = make_error_data(error) },
  };
}

}  // namespace

extern "C" {

ILWEAVE_C_EXPORT IlweavePatchResult ilweave_patch_method(char const* module_path, char const* output_path,
                                                         char const* type_name, char const* method_name) {
  return convert_patch_result(ilweave::PatchMethod(ilweave::PatchRequest{
    .module_path = module_path != nullptr ? module_path : "",
    .output_path = output_path != nullptr ? output_path : "",
    .type_name = type_name != nullptr ? type_name : "",
    .method_name = method_name != nullptr ? method_name : "",
  }));
}

ILWEAVE_C_EXPORT_VOID void ilweave_format_error(IlweavePatchErrorData* error, char* buffer, size_t buffer_size) {
  auto patch_error = reinterpret_cast<ilweave::patching::Error*>(error);
  if (buffer != nullptr && buffer_size != 0) {
    auto [out, _] = fmt::format_to_n(buffer, buffer_size - 1, FMT_COMPILE("{}"), *patch_error);
    *out = '\0';  // Suffix with a null
  }
  delete patch_error;
}

ILWEAVE_C_EXPORT_VOID void ilweave_free_error(IlweavePatchErrorData* error) {
  delete reinterpret_cast<ilweave::patching::Error*>(error);
}
}
