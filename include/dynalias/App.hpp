#pragma once

#include "dynalias/AliasMatcher.hpp"
#include "dynalias/CacheStore.hpp"
#include "dynalias/Cli.hpp"
#include "dynalias/DataResolver.hpp"
#include "dynalias/Executor.hpp"
#include "dynalias/Model.hpp"
#include "dynalias/Process.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <span>
#include <string>

namespace dynalias {

// One loaded model plus the engine around it. The cache is passed to every
// component by reference and saved once per top-level command.
class Session {
  Model                          model_;
  CacheStore                     cache_;
  std::unique_ptr<CommandRunner> runner_;
  DataResolver                   resolver_;
  AliasMatcher                   matcher_;
  Executor                       executor_;

public:
  Session(
      Model                          model,
      std::filesystem::path          cache_path,
      std::unique_ptr<CommandRunner> runner,
      crypto::KeyProvider            key_provider = crypto::machine_key
  );

  Session(Session const&)            = delete;
  Session& operator=(Session const&) = delete;

  struct DispatchResult {
    bool found_     = false;
    int  exit_code_ = 0;
  };

  // Global help, command help or execution of the first matching command.
  auto dispatch(Tokens tokens) -> DispatchResult;

  // Line based loop until exit/quit/EOF. Lines go to the bounded history.
  auto run_interactive(std::istream& in, bool show_prompt) -> int;

  [[nodiscard]] auto cache() noexcept -> CacheStore& {
    return cache_;
  }
  [[nodiscard]] auto model() const noexcept -> Model const& {
    return model_;
  }
};

class App {
  cli::ArgumentParser parser_;
  bool                is_interactive_;

public:
  App();

  auto run(int argc, char** argv) -> int;
  auto run(std::span<std::string const> args) -> int;

private:
  // Cache maintenance flags; true when one was given and handled.
  auto handle_management(cli::Arguments const& args, std::filesystem::path const& cache_path) -> bool;
};

} // namespace dynalias
