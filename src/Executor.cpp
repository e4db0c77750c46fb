#include "dynalias/Executor.hpp"
#include "dynalias/Signals.hpp"
#include "dynalias/Template.hpp"
#include "dynalias/Util.hpp"

#include <chrono>
#include <cstdio>
#include <fmt/core.h>
#include <fmt/ranges.h>

namespace dynalias {

namespace {

// Save before the spawn so the child sees the parent's state, then reload +
// save on scope exit so the child's writes and removals are kept.
class CacheSyncGuard {
  CacheStore& cache_;

public:
  explicit CacheSyncGuard(CacheStore& cache) : cache_(cache) {
    cache_.save();
  }
  ~CacheSyncGuard() {
    cache_.reload();
    cache_.save();
  }
  CacheSyncGuard(CacheSyncGuard const&)            = delete;
  CacheSyncGuard& operator=(CacheSyncGuard const&) = delete;
};

ExecStatus status_of(ProcessError::Kind kind) {
  switch (kind) {
  case ProcessError::Kind::TimedOut:
    return ExecStatus::TimedOut;
  case ProcessError::Kind::Interrupted:
    return ExecStatus::Interrupted;
  case ProcessError::Kind::SpawnFailed:
  case ProcessError::Kind::IoError:
    break;
  }
  return ExecStatus::Failed;
}

} // namespace

Executor::Executor(Model const& model, DataResolver& resolver, CacheStore& cache, CommandRunner& runner)
    : model_(model), resolver_(resolver), cache_(cache), runner_(runner) {}

auto Executor::build_command_line(Chain const& chain, Variables const& vars, Tokens remaining) -> std::string {
  auto line = resolve_app_vars(
      chain_template(chain),
      resolver_.source_lookup(),
      vars,
      resolver_.locals_lookup(),
      model_.global_.verbose_
  );
  line = resolve_user_vars(line, vars);
  if (!remaining.empty()) {
    line.push_back(' ');
    line += join_quoted(remaining);
  }
  return line;
}

auto Executor::execute(Chain const& chain, Variables const& vars, Tokens remaining) -> ExecutionOutcome {
  ExecutionOutcome outcome;

  if (chain_is_strict(chain) && !remaining.empty()) {
    fmt::print(stderr, "Error: Strict mode enabled. Unknown arguments: {}\n", fmt::join(remaining, " "));
    outcome.status_ = ExecStatus::StrictViolation;
    return outcome;
  }

  outcome.command_line_ = build_command_line(chain, vars, remaining);
  fmt::print("Running: {}\n", outcome.command_line_);
  fmt::print("{:-<30}\n", "");
  std::fflush(stdout);

  TerminalStateGuard terminal;
  CacheSyncGuard     sync(cache_);

  bool const sets_locals = chain_sets_locals(chain);
  auto const timeout     = std::chrono::seconds(chain_timeout(chain));
  auto const mode        = sets_locals ? OutputMode::Capture : OutputMode::Stream;

  auto result = runner_.run(outcome.command_line_, timeout, mode);
  if (!result) {
    auto const& err = result.error();
    outcome.status_ = status_of(err.kind());
    switch (outcome.status_) {
    case ExecStatus::TimedOut:
      fmt::print(stderr, "\nError: Command timed out after {}s\n", timeout.count());
      break;
    case ExecStatus::Interrupted:
      fmt::print(stderr, "\nOperation cancelled.\n");
      break;
    default:
      fmt::print(stderr, "Execution error: {}\n", err.message());
      break;
    }
    return outcome;
  }

  outcome.exit_code_ = result->exit_code_;
  if (sets_locals) {
    store_locals(*result);
  }
  return outcome;
}

void Executor::store_locals(ProcessResult const& result) {
  auto output = trim(result.stdout_);
  if (output.empty()) {
    fmt::print(stderr, "Error: set-locals command produced no output\n");
    if (!result.stderr_.empty()) {
      fmt::print(stderr, "Stderr: {}\n", trim(result.stderr_));
    }
    return;
  }

  auto parsed = nlohmann::json::parse(output, nullptr, false);
  if (parsed.is_discarded()) {
    fmt::print(stderr, "Error: Command output must be valid JSON when set-locals is true.\n");
    fmt::print(stderr, "Output received: {}\n", preview(output, constant::OUTPUT_PREVIEW_LENGTH));
    if (!result.stderr_.empty()) {
      fmt::print(stderr, "Stderr: {}\n", trim(result.stderr_));
    }
    return;
  }
  if (!parsed.is_object()) {
    fmt::print(stderr, "Error: Output must be a JSON object, not a list or scalar\n");
    fmt::print(stderr, "Output received: {}\n", preview(output, constant::OUTPUT_PREVIEW_LENGTH));
    return;
  }

  for (auto const& [key, value] : parsed.items()) {
    auto text = display_value(value);
    cache_.set_local(key, text);
    if (model_.global_.verbose_) {
      fmt::print("[VERBOSE] Set local: {} = '{}'\n", key, text);
    }
  }
  fmt::print("{}\n", parsed.dump(2));

  if (result.exit_code_ != 0 && !result.stderr_.empty()) {
    fmt::print(stderr, "{}\n", trim(result.stderr_));
  }
}

} // namespace dynalias
