#pragma once

#include "dynalias/Result.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace dynalias {

enum class OutputMode {
  Stream, // child inherits stdout/stderr
  Capture // stdout and stderr are collected
};

struct ProcessResult {
  int         exit_code_ = 0;
  std::string stdout_;
  std::string stderr_;
};

class ProcessError {
public:
  enum class Kind { SpawnFailed, TimedOut, Interrupted, IoError };

  ProcessError(Kind kind, std::string msg);

  [[nodiscard]] Kind               kind() const noexcept;
  [[nodiscard]] std::string const& message() const noexcept;

private:
  Kind        kind_;
  std::string message_;
};

// Boundary to the operating system: runs one command line through a shell.
// A timeout of zero means no limit.
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  virtual auto run(std::string const& command, std::chrono::seconds timeout, OutputMode mode)
      -> Result<ProcessResult, ProcessError> = 0;
};

// fork + exec of /bin/sh -c. Signal dispositions are guarded around the
// spawn; a timed out child gets SIGTERM, then SIGKILL.
class ShellRunner final : public CommandRunner {
public:
  auto run(std::string const& command, std::chrono::seconds timeout, OutputMode mode)
      -> Result<ProcessResult, ProcessError> override;
};

auto make_shell_runner() -> std::unique_ptr<CommandRunner>;

} // namespace dynalias
