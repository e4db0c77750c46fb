#pragma once

#include "dynalias/Crypto.hpp"
#include "dynalias/Model.hpp"
#include "dynalias/Process.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace dynalias::test {

// Fresh directory under $TMPDIR, removed with everything in it.
class TempDir {
  std::filesystem::path path_;

public:
  TempDir() {
    auto pattern = (std::filesystem::temp_directory_path() / "dynalias-test-XXXXXX").string();
    if (mkdtemp(pattern.data()) == nullptr) {
      ADD_FAILURE() << "mkdtemp failed";
    }
    path_ = pattern;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(TempDir const&)            = delete;
  TempDir& operator=(TempDir const&) = delete;

  [[nodiscard]] std::filesystem::path const& path() const noexcept {
    return path_;
  }
  [[nodiscard]] std::filesystem::path operator/(std::string const& name) const {
    return path_ / name;
  }
};

inline crypto::Key fixed_key(unsigned char fill) {
  crypto::Key key{};
  key.fill(fill);
  return key;
}

// Key provider that never touches the machine identity.
inline crypto::KeyProvider test_key_provider(unsigned char fill = 0x42) {
  return [fill]() -> Result<crypto::Key> { return fixed_key(fill); };
}

// Records every command and answers from a handler (default: exit 0, no output).
class FakeRunner final : public CommandRunner {
public:
  using Handler = std::function<Result<ProcessResult, ProcessError>(std::string const&)>;

  std::vector<std::string>          commands_;
  std::vector<OutputMode>           modes_;
  std::vector<std::chrono::seconds> timeouts_;
  Handler                           handler_;

  FakeRunner() = default;
  explicit FakeRunner(Handler handler) : handler_(std::move(handler)) {}

  auto run(std::string const& command, std::chrono::seconds timeout, OutputMode mode)
      -> Result<ProcessResult, ProcessError> override {
    commands_.push_back(command);
    modes_.push_back(mode);
    timeouts_.push_back(timeout);
    if (handler_) {
      return handler_(command);
    }
    return ProcessResult{};
  }

  [[nodiscard]] size_t count_containing(std::string_view needle) const {
    size_t n = 0;
    for (auto const& c : commands_) {
      if (c.find(needle) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }
};

inline ProcessResult output(std::string stdout_text, int exit_code = 0, std::string stderr_text = "") {
  return ProcessResult{exit_code, std::move(stdout_text), std::move(stderr_text)};
}

inline DynamicSource dynamic_source(
    std::string                                      name,
    std::string                                      command,
    std::vector<std::pair<std::string, std::string>> mapping,
    int                                              priority = constant::DEFAULT_SOURCE_PRIORITY
) {
  DynamicSource source;
  source.name_     = std::move(name);
  source.command_  = std::move(command);
  source.mapping_  = std::move(mapping);
  source.priority_ = priority;
  return source;
}

inline CommandNode node(NodeKind kind, std::string alias, std::string command) {
  CommandNode n;
  n.kind_    = kind;
  n.name_    = alias;
  n.aliases_ = {std::move(alias)};
  n.command_ = std::move(command);
  return n;
}

inline CommandNode command(std::string alias, std::string cmd) {
  return node(NodeKind::Command, std::move(alias), std::move(cmd));
}

inline CommandNode sub_command(std::string alias, std::string cmd) {
  return node(NodeKind::SubCommand, std::move(alias), std::move(cmd));
}

inline CommandNode arg(std::vector<std::string> aliases, std::string cmd) {
  CommandNode n;
  n.kind_    = NodeKind::Arg;
  n.aliases_ = std::move(aliases);
  n.command_ = std::move(cmd);
  return n;
}

} // namespace dynalias::test
