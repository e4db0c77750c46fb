#pragma once

#include "dynalias/Result.hpp"

#include <utility>

namespace dynalias {

class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) noexcept;
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const noexcept;
  [[nodiscard]] bool valid() const noexcept;
  int                release() noexcept;
  void               reset(int fd = -1) noexcept;
};

// Read end first. Both ends are close-on-exec.
Result<std::pair<FileDescriptor, FileDescriptor>> make_pipe();

} // namespace dynalias
