#include "module.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include "file-handle.hpp"
#include "util.hpp"

namespace {
using namespace ilweave;
using ResultT = Result<Module, OpenError>;
}  // namespace

namespace ilweave {

Result<Module, OpenError> Module::Open(std::string const& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return ResultT::Err(OpenError{ .path = path, .reason = ec ? ec.message() : "not a regular file" });
  }
  auto const size = std::filesystem::file_size(path, ec);
  if (ec) {
    return ResultT::Err(OpenError{ .path = path, .reason = ec.message() });
  }
  std::vector<uint8_t> bytes;
  {
    FileHandle file(std::fopen(path.c_str(), "rb"));
    if (!file) {
      return ResultT::Err(OpenError{ .path = path, .reason = std::strerror(errno) });
    }
    bytes.resize(static_cast<std::size_t>(size));
    if (!bytes.empty() && std::fread(bytes.data(), 1, bytes.size(), file.get()) != bytes.size()) {
      return ResultT::Err(OpenError{ .path = path, .reason = "short read" });
    }
  }
  ILWEAVE_DEBUG("Read {} bytes from {}", bytes.size(), path);
  return FromBytes(std::move(bytes), path);
}

Result<Module, OpenError> Module::FromBytes(std::vector<uint8_t> bytes, std::string origin) {
  auto image = PeImage::Parse(bytes);
  if (!image.has_value()) {
    return ResultT::Err(OpenError{ .path = std::move(origin), .reason = image.error().reason });
  }
  auto metadata = Metadata::Parse(bytes, image.value());
  if (!metadata.has_value()) {
    return ResultT::Err(OpenError{ .path = std::move(origin), .reason = metadata.error().reason });
  }
  return ResultT::Ok(
      Module(std::move(bytes), std::move(image).value(), std::move(metadata).value(), std::move(origin)));
}

std::optional<TypeEntry> Module::FindType(std::string_view full_name) const {
  for (auto const& type : metadata_.types) {
    if (type.full_name == full_name) return type;
  }
  return std::nullopt;
}

std::optional<MethodDescriptor> Module::FindMethod(TypeEntry const& type, std::string_view name) const {
  for (auto row : type.method_rows) {
    auto const* method = metadata_.Method(row);
    if (method != nullptr && method->name == name) {
      return DescribeMethod(type, *method);
    }
  }
  return std::nullopt;
}

std::vector<MethodDescriptor> Module::Methods(TypeEntry const& type) const {
  std::vector<MethodDescriptor> methods;
  methods.reserve(type.method_rows.size());
  for (auto row : type.method_rows) {
    if (auto const* method = metadata_.Method(row)) {
      methods.push_back(DescribeMethod(type, *method));
    }
  }
  return methods;
}

}  // namespace ilweave
