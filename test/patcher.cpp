// Tests for the patch writer: in-memory patches, file patches and the end-to-end default-return behaviour
#include <fmt/core.h>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include "../shared/patcher.hpp"
#include "cil-evaluator.hpp"
#include "module-builder.hpp"
#include "test-wrapper.hpp"

namespace {

test::ModuleBuilder sample_builder() {
  return test::ModuleBuilder{
    .types = {
      test::TypeSpec{
        .namespaze = "",
        .name = "Sample",
        .methods = {
          // ldarg.1; ldc.i4.s 40; add; ldc.i4.2; add; ret
          test::MethodSpec{ "Compute", test::MethodSig(test::sig::kHasThis, 1, { test::sig::kI4, test::sig::kI4 }),
                            test::FatBody({ 0x03, 0x1F, 40, 0x58, 0x18, 0x58, 0x2A }) },
          // ldc.i4 1000; conv.i8; ret
          test::MethodSpec{ "Total", test::MethodSig(test::sig::kDefault, 0, { test::sig::kI8 }),
                            test::TinyBody({ 0x20, 0xE8, 0x03, 0x00, 0x00, 0x6A, 0x2A }),
                            test::kPublic | test::kStatic },
          // ldc.r8 2.5; ret
          test::MethodSpec{ "Ratio", test::MethodSig(test::sig::kDefault, 0, { test::sig::kR8 }),
                            test::TinyBody({ 0x23, 0, 0, 0, 0, 0, 0, 0x04, 0x40, 0x2A }),
                            test::kPublic | test::kStatic },
          // ldc.i4.1; ret
          test::MethodSpec{ "Flag", test::MethodSig(test::sig::kDefault, 0, { test::sig::kBoolean }),
                            test::TinyBody({ 0x17, 0x2A }), test::kPublic | test::kStatic },
          test::MethodSpec{ "Label", test::MethodSig(test::sig::kHasThis, 0, { test::sig::kObject }),
                            test::TinyBody({ 0x14, 0x2A }) },
          test::MethodSpec{ "Touch", test::MethodSig(test::sig::kHasThis, 0, { test::sig::kVoid }),
                            test::TinyBody({ 0x00, 0x00, 0x2A }) },
          // A struct returned by value: VALUETYPE TypeRef 1
          test::MethodSpec{ "Point", test::MethodSig(test::sig::kDefault, 0, { test::sig::kValueType, 0x05 }),
                            test::TinyBody({ 0x14, 0x2A }), test::kPublic | test::kStatic },
          test::MethodSpec{ "Guarded", test::MethodSig(test::sig::kDefault, 0, { test::sig::kI4 }),
                            test::FatBody({ 0x16, 0x2A }, true), test::kPublic | test::kStatic },
          test::MethodSpec{ "Abstract", test::MethodSig(test::sig::kHasThis, 0, { test::sig::kI4 }), {},
                            test::kPublic | test::kVirtual | test::kAbstract },
          // A one byte body (bare ret) cannot hold any two byte default sequence
          test::MethodSpec{ "Cramped", test::MethodSig(test::sig::kDefault, 0, { test::sig::kI4 }),
                            std::vector<uint8_t>{ 0x02 }, test::kPublic | test::kStatic },
        },
      },
    },
  };
}

std::size_t offset_of(test::BuiltModule const& built, std::string const& method) {
  auto const* body = built.body("Sample", method);
  if (body == nullptr) {
    ERROR("No body recorded for: {}", method);
  }
  return body->file_offset;
}

void expect_only_span_changed(std::vector<uint8_t> const& before, std::vector<uint8_t> const& after,
                              ilweave::PatchSummary const& summary) {
  expect_eq(after.size(), before.size(), "patched length");
  for (std::size_t i = 0; i < before.size(); i++) {
    bool const in_span = i >= summary.file_offset && i < summary.file_offset + summary.span;
    if (!in_span && before[i] != after[i]) {
      ERROR("Byte outside the patched span changed at: {:#x} (span: {:#x}+{:#x})", i, summary.file_offset,
            summary.span);
    }
  }
  for (std::size_t i = summary.file_offset + summary.encoded_size; i < summary.file_offset + summary.span; i++) {
    if (after[i] != 0) {
      ERROR("Span tail not zero filled at: {:#x}", i);
    }
  }
}

ilweave::PatchSummary patch_or_fail(std::vector<uint8_t>& bytes, std::string const& method) {
  auto result = ilweave::PatchImage(bytes, "Sample", method);
  if (!result.has_value()) {
    ERROR("Failed to patch {}: {}", method, result.error());
  }
  return result.value();
}

void test_patch_defaults() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "Patched methods return their default value");
  auto built = sample_builder().Build();
  auto check = [&built](std::string const& method, std::vector<test::Value> const& args, test::Value original,
                        test::Value patched_value) {
    auto before = test::Evaluate(built.bytes, offset_of(built, method), args);
    if (!before || !(*before == original)) {
      ERROR("Unexpected original result for {}", method);
    }
    auto bytes = built.bytes;
    auto summary = patch_or_fail(bytes, method);
    expect_only_span_changed(built.bytes, bytes, summary);
    auto after = test::Evaluate(bytes, offset_of(built, method), args);
    if (!after) {
      ERROR("Patched body for {} does not evaluate", method);
    }
    expect_eq(*after, patched_value, "patched result");
  };
  check("Compute", { test::Value::Null(), test::Value::I4(5) }, test::Value::I4(47), test::Value::I4(0));
  check("Total", {}, test::Value::I8(1000), test::Value::I8(0));
  check("Ratio", {}, test::Value{ .kind = test::Value::Kind::Float, .f = 2.5 },
        test::Value{ .kind = test::Value::Kind::Float });
  check("Flag", {}, test::Value::I4(1), test::Value::I4(0));
  check("Label", { test::Value::Null() }, test::Value::Null(), test::Value::Null());
  check("Touch", { test::Value::Null() }, test::Value{}, test::Value{});
}

void test_patch_is_idempotent() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "Patching twice yields identical bytes");
  auto built = sample_builder().Build();
  auto once = built.bytes;
  auto first = patch_or_fail(once, "Compute");
  auto twice = once;
  auto second = patch_or_fail(twice, "Compute");
  if (once != twice) {
    ERROR("Second patch changed the image for: {}", "Compute");
  }
  // The second patch sees the tiny body the first one wrote
  expect_eq(first.original.encoding, ilweave::BodyEncoding::Fat, "first patch replaced a fat body");
  expect_eq(second.original.encoding, ilweave::BodyEncoding::Tiny, "second patch replaced a tiny body");
  expect_eq(second.span, 3U, "second span");
}

void test_patch_rejections() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "Unsupported targets are rejected without mutation");
  auto built = sample_builder().Build();
  auto expect_error = [&built]<class E>(std::string const& type, std::string const& method) {
    auto bytes = built.bytes;
    auto result = ilweave::PatchImage(bytes, type, method);
    if (result.has_value()) {
      ERROR("Patch of {}::{} should have failed", type, method);
    }
    if (!std::holds_alternative<E>(result.error())) {
      ERROR("Patch of {}::{} failed with the wrong error: {}", type, method, result.error());
    }
    if (bytes != built.bytes) {
      ERROR("Failed patch of {}::{} mutated the image", type, method);
    }
    fmt::print("Rejected as expected: {}\n", result.error());
    return std::get<E>(result.error());
  };
  expect_error.template operator()<ilweave::patching::TypeNotFound>("Missing", "Compute");
  expect_error.template operator()<ilweave::patching::MethodNotFound>("Sample", "Missing");
  expect_error.template operator()<ilweave::patching::UnsupportedReturn>("Sample", "Point");
  expect_error.template operator()<ilweave::patching::NoBody>("Sample", "Abstract");
  auto guarded = expect_error.template operator()<ilweave::patching::UnsupportedBody>("Sample", "Guarded");
  expect_eq(guarded.has_exception_handlers, true, "has exception handlers");
  auto cramped = expect_error.template operator()<ilweave::patching::BodyTooLarge>("Sample", "Cramped");
  expect_eq(cramped.encoded_size, 3UL, "encoded size");
  expect_eq(cramped.available, 1UL, "available span");

  // PatchModule writes into a caller buffer that must match the module
  auto module = ilweave::Module::FromBytes(built.bytes, "sample");
  if (!module.has_value()) {
    ERROR("Failed to parse sample: {}", module.error());
  }
  std::vector<uint8_t> short_buffer(built.bytes.begin(), built.bytes.begin() + offset_of(built, "Compute") + 4);
  auto const short_copy = short_buffer;
  auto mismatched = ilweave::PatchModule(module.value(), "Sample", "Compute", short_buffer);
  if (mismatched.has_value() || !std::holds_alternative<ilweave::patching::IoError>(mismatched.error())) {
    ERROR("Expected IoError for a buffer of: {} bytes", short_buffer.size());
  }
  if (short_buffer != short_copy) {
    ERROR("Mismatched buffer was written: {} bytes", short_buffer.size());
  }

  std::vector<uint8_t> not_a_module(64, 0);
  auto result = ilweave::PatchImage(not_a_module, "Sample", "Compute");
  if (result.has_value() || !std::holds_alternative<ilweave::OpenError>(result.error())) {
    ERROR("Expected OpenError for a buffer of: {} bytes", not_a_module.size());
  }
}

void test_patch_file() {
  TestWrapper wrapper(std::span<uint8_t const>{}, "Patching a file writes the output wholesale");
  auto dir = test::ScratchDirectory("patch-file");
  auto built = sample_builder().Build();
  auto input = dir / "Sample.dll";
  if (!test::WriteFile(input, built.bytes)) {
    ERROR("Failed to write: {}", input.string());
  }
  // Output into a directory that does not exist yet
  auto output = dir / "out" / "nested" / "Sample.dll";
  auto result = ilweave::PatchMethod(ilweave::PatchRequest{
    .module_path = input,
    .output_path = output,
    .type_name = "Sample",
    .method_name = "Compute",
  });
  if (!result.has_value()) {
    ERROR("Failed to patch file: {}", result.error());
  }
  auto written = test::ReadFile(output);
  if (!written) {
    ERROR("Output not written: {}", output.string());
  }
  expect_only_span_changed(built.bytes, *written, result.value());
  auto value = test::Evaluate(*written, offset_of(built, "Compute"), { test::Value::Null(), test::Value::I4(5) });
  if (!value) {
    ERROR("Patched Compute does not evaluate in: {}", output.string());
  }
  expect_eq(*value, test::Value::I4(0), "Compute after patching");
  // The input is untouched and no temporary is left behind
  auto input_after = test::ReadFile(input);
  if (!input_after || *input_after != built.bytes) {
    ERROR("Input was modified: {}", input.string());
  }
  std::size_t entries = 0;
  for ([[maybe_unused]] auto const& entry : std::filesystem::directory_iterator(output.parent_path())) entries++;
  expect_eq(entries, 1UL, "files in the output directory");

  // Patching the output again in place gives the same bytes
  auto again = ilweave::PatchMethod(ilweave::PatchRequest{
    .module_path = output,
    .output_path = output,
    .type_name = "Sample",
    .method_name = "Compute",
  });
  if (!again.has_value()) {
    ERROR("Failed to re-patch file: {}", again.error());
  }
  auto rewritten = test::ReadFile(output);
  if (!rewritten || *rewritten != *written) {
    ERROR("Re-patching changed the output: {}", output.string());
  }

  // Failures write nothing
  auto rejected_output = dir / "rejected" / "Sample.dll";
  auto rejected = ilweave::PatchMethod(ilweave::PatchRequest{
    .module_path = input,
    .output_path = rejected_output,
    .type_name = "Sample",
    .method_name = "Point",
  });
  if (rejected.has_value() || !std::holds_alternative<ilweave::patching::UnsupportedReturn>(rejected.error())) {
    ERROR("Expected UnsupportedReturn for: {}", "Point");
  }
  if (std::filesystem::exists(rejected_output)) {
    ERROR("Rejected patch wrote output: {}", rejected_output.string());
  }

  auto missing = ilweave::PatchMethod(ilweave::PatchRequest{
    .module_path = dir / "missing.dll",
    .output_path = dir / "missing-out.dll",
    .type_name = "Sample",
    .method_name = "Compute",
  });
  if (missing.has_value() || !std::holds_alternative<ilweave::OpenError>(missing.error())) {
    ERROR("Expected OpenError for: {}", "missing.dll");
  }
  if (std::filesystem::exists(dir / "missing-out.dll")) {
    ERROR("Failed open wrote output: {}", "missing-out.dll");
  }
}

}  // namespace

int main() {
  test_patch_defaults();
  test_patch_is_idempotent();
  test_patch_rejections();
  test_patch_file();
  puts("ALL GOOD!");
}
