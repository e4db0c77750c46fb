#include "dynalias/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fmt/core.h>

#include <fcntl.h>
#include <unistd.h>

namespace dynalias {

FileDescriptor::FileDescriptor(int fd) noexcept
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

int FileDescriptor::get() const noexcept {
  return fd_;
}

bool FileDescriptor::valid() const noexcept {
  return fd_ != -1;
}

int FileDescriptor::release() noexcept {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::reset(int fd) noexcept {
  if (fd_ != -1 && fd_ != fd) {
    close(fd_);
  }
  fd_ = fd;
}

Result<std::pair<FileDescriptor, FileDescriptor>> make_pipe() {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) < 0) {
    return std::unexpected(fmt::format("pipe: {}", std::strerror(errno)));
  }
  return std::pair{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

} // namespace dynalias
