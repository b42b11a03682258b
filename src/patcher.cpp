#include "patcher.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <optional>
#include <span>
#include <system_error>
#include <utility>

#include "file-handle.hpp"
#include "util.hpp"

namespace {
using namespace ilweave;
using ResultT = patching::Result;

patching::Error ToPatchError(locating::Error const& error) {
  return std::visit([](auto const& alternative) -> patching::Error { return alternative; }, error);
}

patching::Error ToPatchError(encoding::Error const& error, MethodDescriptor const& method) {
  return std::visit(util::overload{
                      [&](encoding::UnsupportedReturn const&) -> patching::Error {
                        return patching::UnsupportedReturn{ method };
                      },
                      [&](encoding::BodyTooLarge const& too_large) -> patching::Error {
                        return patching::BodyTooLarge{ method, too_large.code_size, kTinyHeaderMaxCode };
                      } },
                    error);
}

/// @brief Writes the buffer to a sibling temporary file, then renames it over path.
std::optional<patching::IoError> write_atomically(std::filesystem::path const& path, std::span<uint8_t const> bytes) {
  std::error_code ec;
  if (path.empty() || !path.has_filename()) {
    return patching::IoError{ path.string(), "output path does not name a file" };
  }
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return patching::IoError{ path.parent_path().string(), ec.message() };
    }
  }
  auto temp = path;
  temp += ".ilweave-tmp";
  {
    FileHandle file(std::fopen(temp.c_str(), "wb"));
    if (!file) {
      return patching::IoError{ temp.string(), std::strerror(errno) };
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), file.get()) != bytes.size() || std::fflush(file.get()) != 0) {
      auto reason = std::string(std::strerror(errno));
      file.reset();
      std::filesystem::remove(temp, ec);
      return patching::IoError{ temp.string(), std::move(reason) };
    }
    if (std::fclose(file.release()) != 0) {
      auto reason = std::string(std::strerror(errno));
      std::filesystem::remove(temp, ec);
      return patching::IoError{ temp.string(), std::move(reason) };
    }
  }
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    auto reason = ec.message();
    std::filesystem::remove(temp, ec);
    return patching::IoError{ path.string(), std::move(reason) };
  }
  return std::nullopt;
}

}  // namespace

namespace ilweave {

patching::Result PatchModule(Module const& module, std::string_view type_name, std::string_view method_name,
                             std::span<uint8_t> out) {
  if (out.size() != module.bytes().size()) {
    return ResultT::ErrAt<patching::IoError>(patching::IoError{
        module.origin(), fmt::format("output buffer holds {} bytes but the module has {}", out.size(),
                                     module.bytes().size()) });
  }
  auto type = module.FindType(type_name);
  if (!type) {
    return ResultT::ErrAt<patching::TypeNotFound>(patching::TypeNotFound{ std::string(type_name) });
  }
  auto method = module.FindMethod(*type, method_name);
  if (!method) {
    return ResultT::ErrAt<patching::MethodNotFound>(
        patching::MethodNotFound{ std::string(type_name), std::string(method_name) });
  }
  auto located = LocateBody(module, *method);
  if (!located.has_value()) {
    return ResultT::Err(ToPatchError(located.error()));
  }
  auto encoded = EncodeDefaultBody(method->return_category);
  if (!encoded.has_value()) {
    return ResultT::Err(ToPatchError(encoded.error(), *method));
  }
  auto const& body = located.value();
  auto const& replacement = encoded.value();
  auto const span = body.header.span();
  if (replacement.size() > span) {
    return ResultT::ErrAt<patching::BodyTooLarge>(patching::BodyTooLarge{ *method, replacement.size(), span });
  }

  auto target = out.subspan(body.file_offset, span);
  auto tail = std::copy(replacement.begin(), replacement.end(), target.begin());
  std::fill(tail, target.end(), static_cast<uint8_t>(0));
  ILWEAVE_DEBUG("Patched {} at {:#x}: replaced {} with {} bytes", *method, body.file_offset, body.header,
                replacement.size());
  return ResultT::Ok(PatchSummary{
    .method = *method,
    .file_offset = body.file_offset,
    .original = body.header,
    .span = span,
    .encoded_size = static_cast<uint32_t>(replacement.size()),
  });
}

patching::Result PatchImage(std::vector<uint8_t>& bytes, std::string_view type_name, std::string_view method_name) {
  auto module = Module::FromBytes(bytes, "<memory>");
  if (!module.has_value()) {
    return ResultT::Err(module.error());
  }
  // Patch a copy so a failure leaves the caller's buffer untouched
  auto patched = bytes;
  auto result = PatchModule(module.value(), type_name, method_name, patched);
  if (result.has_value()) {
    bytes = std::move(patched);
  }
  return result;
}

patching::Result PatchMethod(PatchRequest const& request) {
  ILWEAVE_DEBUG("Patching {}::{} in {} -> {}", request.type_name, request.method_name, request.module_path.string(),
                request.output_path.string());
  auto module = Module::Open(request.module_path.string());
  if (!module.has_value()) {
    return ResultT::Err(module.error());
  }
  auto const input = module.value().bytes();
  std::vector<uint8_t> output(input.begin(), input.end());
  auto result = PatchModule(module.value(), request.type_name, request.method_name, output);
  if (!result.has_value()) {
    ILWEAVE_DEBUG("Patch failed: {}", result.error());
    return result;
  }
  if (auto io_error = write_atomically(request.output_path, output)) {
    return ResultT::Err(std::move(*io_error));
  }
  return result;
}

}  // namespace ilweave
