#include <fmt/core.h>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "../shared/capi.h"
#include "cil-evaluator.hpp"
#include "module-builder.hpp"
#include "test-wrapper.hpp"

namespace {

test::BuiltModule build_sample() {
  return test::ModuleBuilder{
    .types = {
      test::TypeSpec{
        .namespaze = "Api",
        .name = "Target",
        .methods = {
          // ldc.i4.7; ret
          test::MethodSpec{ "Seven", test::MethodSig(test::sig::kDefault, 0, { test::sig::kI4 }),
                            test::TinyBody({ 0x1D, 0x2A }), test::kPublic | test::kStatic },
          test::MethodSpec{ "Generic", test::MethodSig(test::sig::kGeneric, 1, { 0x00, test::sig::kMVar, 0x00 }),
                            test::TinyBody({ 0x14, 0x2A }), test::kPublic | test::kStatic },
        },
      },
    },
  }
      .Build();
}

std::string consume_error(IlweavePatchResult const& result) {
  char buffer[256];
  ilweave_format_error(result.value.data, buffer, sizeof(buffer));
  return std::string(buffer);
}

void test_patch_success() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "ilweave_patch_method patches and reports the span");
  auto dir = test::ScratchDirectory("api-success");
  auto built = build_sample();
  auto input = dir / "Target.dll";
  if (!test::WriteFile(input, built.bytes)) {
    ERROR("Failed to write: {}", input.string());
  }
  auto output = dir / "patched" / "Target.dll";
  auto result = ilweave_patch_method(input.c_str(), output.c_str(), "Api.Target", "Seven");
  if (result.result != ILWEAVE_PATCH_OK) {
    ERROR("Patch failed with code: {}: {}", static_cast<int>(result.result), consume_error(result));
  }
  auto const* body = built.body("Api.Target", "Seven");
  expect_eq(result.value.info.file_offset, body->file_offset, "reported file offset");
  expect_eq(result.value.info.span, 3U, "reported span");
  expect_eq(result.value.info.encoded_size, 3U, "reported encoded size");

  auto written = test::ReadFile(output);
  if (!written) {
    ERROR("Output not written: {}", output.string());
  }
  auto value = test::Evaluate(*written, body->file_offset);
  if (!value) {
    ERROR("Patched body does not evaluate at: {:#x}", body->file_offset);
  }
  expect_eq(*value, test::Value::I4(0), "Seven after patching");
}

void test_patch_errors() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "ilweave_patch_method reports errors by code");
  auto dir = test::ScratchDirectory("api-errors");
  auto built = build_sample();
  auto input = dir / "Target.dll";
  if (!test::WriteFile(input, built.bytes)) {
    ERROR("Failed to write: {}", input.string());
  }
  auto output = dir / "out.dll";

  auto missing_type = ilweave_patch_method(input.c_str(), output.c_str(), "Target", "Seven");
  expect_eq(static_cast<int>(missing_type.result), static_cast<int>(ILWEAVE_PATCH_TYPE_NOT_FOUND), "missing type code");
  auto message = consume_error(missing_type);
  if (message.find("Target") == std::string::npos) {
    ERROR("Error message does not name the type: {}", message);
  }

  auto missing_method = ilweave_patch_method(input.c_str(), output.c_str(), "Api.Target", "Eight");
  expect_eq(static_cast<int>(missing_method.result), static_cast<int>(ILWEAVE_PATCH_METHOD_NOT_FOUND),
            "missing method code");
  ilweave_free_error(missing_method.value.data);

  auto generic = ilweave_patch_method(input.c_str(), output.c_str(), "Api.Target", "Generic");
  expect_eq(static_cast<int>(generic.result), static_cast<int>(ILWEAVE_PATCH_UNSUPPORTED_RETURN),
            "generic return code");
  fmt::print("Generic return: {}\n", consume_error(generic));

  auto missing_file = ilweave_patch_method((dir / "nope.dll").c_str(), output.c_str(), "Api.Target", "Seven");
  expect_eq(static_cast<int>(missing_file.result), static_cast<int>(ILWEAVE_PATCH_OPEN_ERROR), "missing file code");
  ilweave_free_error(missing_file.value.data);

  auto directory = ilweave_patch_method(dir.c_str(), output.c_str(), "Api.Target", "Seven");
  expect_eq(static_cast<int>(directory.result), static_cast<int>(ILWEAVE_PATCH_OPEN_ERROR), "directory input code");
  ilweave_free_error(directory.value.data);

  auto no_output = ilweave_patch_method(input.c_str(), nullptr, "Api.Target", "Seven");
  expect_eq(static_cast<int>(no_output.result), static_cast<int>(ILWEAVE_PATCH_IO_ERROR), "null output code");
  ilweave_free_error(no_output.value.data);

  if (std::filesystem::exists(output)) {
    ERROR("Failed patches wrote output: {}", output.string());
  }
}

void test_format_truncates() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "ilweave_format_error truncates to the buffer");
  auto dir = test::ScratchDirectory("api-format");
  auto result = ilweave_patch_method((dir / "nope.dll").c_str(), (dir / "out.dll").c_str(), "A", "B");
  if (result.result == ILWEAVE_PATCH_OK) {
    ERROR("Patching a missing file succeeded: {}", (dir / "nope.dll").string());
  }
  char small[8];
  std::memset(small, 'x', sizeof(small));
  ilweave_format_error(result.value.data, small, sizeof(small));
  expect_eq(std::strlen(small), sizeof(small) - 1, "truncated length");
}

}  // namespace

int main() {
  test_patch_success();
  test_patch_errors();
  test_format_truncates();
  puts("ALL GOOD!");
}
