#pragma once

#include "dynalias/AliasMatcher.hpp"
#include "dynalias/CacheStore.hpp"
#include "dynalias/DataResolver.hpp"
#include "dynalias/Model.hpp"
#include "dynalias/Process.hpp"

#include <string>

namespace dynalias {

enum class ExecStatus {
  Completed,       // process ran, see exit code
  StrictViolation, // unknown trailing args on a strict command, nothing ran
  TimedOut,
  Interrupted,
  Failed // could not spawn or talk to the child
};

struct ExecutionOutcome {
  ExecStatus  status_    = ExecStatus::Completed;
  int         exit_code_ = 0;
  std::string command_line_;
};

class Executor {
  Model const&   model_;
  DataResolver&  resolver_;
  CacheStore&    cache_;
  CommandRunner& runner_;

public:
  Executor(Model const& model, DataResolver& resolver, CacheStore& cache, CommandRunner& runner);

  // Joined chain template with app variables, then user variables, resolved
  // and the extra tokens shell-quoted on the end.
  auto build_command_line(Chain const& chain, Variables const& vars, Tokens remaining) -> std::string;

  // Run a matched chain. The cache is saved before the spawn, then reloaded
  // from disk and saved after it on every path, keeping whatever the child
  // wrote or removed.
  auto execute(Chain const& chain, Variables const& vars, Tokens remaining) -> ExecutionOutcome;

private:
  void store_locals(ProcessResult const& result);
};

} // namespace dynalias
