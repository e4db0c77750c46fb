#include "dynalias/Process.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/FileDescriptor.hpp"
#include "dynalias/Signals.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <thread>
#include <fmt/core.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <poll.h>
#include <unistd.h>

namespace dynalias {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(10);
constexpr auto TERMINATE_GRACE    = std::chrono::seconds(1);
constexpr int  SIGINT_EXIT_CODE   = constant::SIGNAL_EXIT_CODE_OFFSET + SIGINT;

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return constant::SIGNAL_EXIT_CODE_OFFSET + WTERMSIG(status);
  }
  return 1;
}

int remaining_ms(std::optional<Clock::time_point> const& deadline) {
  if (!deadline) {
    return -1;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

bool expired(std::optional<Clock::time_point> const& deadline) {
  return deadline && Clock::now() >= *deadline;
}

void terminate_child(pid_t pid) {
  kill(pid, SIGTERM);
  auto give_up = Clock::now() + TERMINATE_GRACE;
  int  status  = 0;
  while (Clock::now() < give_up) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid || (r < 0 && errno != EINTR)) {
      return;
    }
    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
  }
  kill(pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

ProcessError timed_out(std::chrono::seconds timeout) {
  return ProcessError(ProcessError::Kind::TimedOut, fmt::format("Command timed out after {}s", timeout.count()));
}

[[noreturn]] void exec_shell(std::string const& command, FileDescriptor const& out, FileDescriptor const& err) {
  set_child_signals();
  if (out.valid() && dup2(out.get(), STDOUT_FILENO) < 0) {
    fmt::print(stderr, "dup2 stdout: {}\n", std::strerror(errno));
    _exit(1);
  }
  if (err.valid() && dup2(err.get(), STDERR_FILENO) < 0) {
    fmt::print(stderr, "dup2 stderr: {}\n", std::strerror(errno));
    _exit(1);
  }
  execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
  fmt::print(stderr, "/bin/sh: {}\n", std::strerror(errno));
  _exit(errno == ENOENT ? 127 : 126);
}

} // namespace

ProcessError::ProcessError(Kind kind, std::string msg)
    : kind_(kind), message_(std::move(msg)) {}

ProcessError::Kind ProcessError::kind() const noexcept {
  return kind_;
}

std::string const& ProcessError::message() const noexcept {
  return message_;
}

auto ShellRunner::run(std::string const& command, std::chrono::seconds timeout, OutputMode mode)
    -> Result<ProcessResult, ProcessError> {
  FileDescriptor out_read;
  FileDescriptor out_write;
  FileDescriptor err_read;
  FileDescriptor err_write;

  if (mode == OutputMode::Capture) {
    auto out_pipe = make_pipe();
    auto err_pipe = make_pipe();
    if (!out_pipe || !err_pipe) {
      auto const& msg = !out_pipe ? out_pipe.error() : err_pipe.error();
      return std::unexpected(ProcessError(ProcessError::Kind::IoError, msg));
    }
    out_read  = std::move(out_pipe->first);
    out_write = std::move(out_pipe->second);
    err_read  = std::move(err_pipe->first);
    err_write = std::move(err_pipe->second);
  }

  ForegroundSignalGuard signal_guard;

  pid_t pid = fork();
  if (pid < 0) {
    return std::unexpected(ProcessError(ProcessError::Kind::SpawnFailed, fmt::format("fork: {}", std::strerror(errno))));
  }
  if (pid == 0) {
    exec_shell(command, out_write, err_write);
  }

  out_write.reset();
  err_write.reset();

  std::optional<Clock::time_point> deadline;
  if (timeout.count() > 0) {
    deadline = Clock::now() + timeout;
  }

  ProcessResult result;

  std::array<pollfd, 2>        fds{};
  std::array<std::string*, 2> sinks{&result.stdout_, &result.stderr_};
  fds[0] = {out_read.get(), POLLIN, 0};
  fds[1] = {err_read.get(), POLLIN, 0};

  std::array<char, 4096> buffer{};
  while (fds[0].fd != -1 || fds[1].fd != -1) {
    if (expired(deadline)) {
      terminate_child(pid);
      return std::unexpected(timed_out(timeout));
    }
    int ready = poll(fds.data(), fds.size(), remaining_ms(deadline));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      terminate_child(pid);
      return std::unexpected(ProcessError(ProcessError::Kind::IoError, fmt::format("poll: {}", std::strerror(errno))));
    }
    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd == -1 || fds[i].revents == 0) {
        continue;
      }
      ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
      if (n > 0) {
        sinks[i]->append(buffer.data(), static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        fds[i].fd = -1;
      }
    }
  }

  int status = 0;
  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      break;
    }
    if (r < 0) {
      if (errno == EINTR) {
        continue;
      }
      return std::unexpected(ProcessError(ProcessError::Kind::IoError, fmt::format("waitpid: {}", std::strerror(errno))));
    }
    if (expired(deadline)) {
      terminate_child(pid);
      return std::unexpected(timed_out(timeout));
    }
    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
  }

  result.exit_code_ = decode_status(status);
  if ((WIFSIGNALED(status) && WTERMSIG(status) == SIGINT) ||
      (mode == OutputMode::Stream && result.exit_code_ == SIGINT_EXIT_CODE)) {
    return std::unexpected(ProcessError(ProcessError::Kind::Interrupted, "Operation cancelled."));
  }
  return result;
}

auto make_shell_runner() -> std::unique_ptr<CommandRunner> {
  return std::make_unique<ShellRunner>();
}

} // namespace dynalias
