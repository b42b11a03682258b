#pragma once

#include <cstdio>
#include <memory>

namespace ilweave {

struct FileCloser {
  void operator()(std::FILE* file) const {
    std::fclose(file);
  }
};

/// @brief An owned stdio file, closed on scope exit. Call release() to close explicitly and check the result.
using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

}  // namespace ilweave
