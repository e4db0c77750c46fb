#include "dynalias/App.hpp"
#include "dynalias/Config.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/Help.hpp"
#include "dynalias/Util.hpp"

#include <csignal>
#include <cstdio>
#include <iostream>
#include <fmt/core.h>
#include <fmt/std.h>

#include <unistd.h>

namespace dynalias {

namespace {

std::string flag(std::string_view name) {
  return fmt::format("{}-{}", constant::EXE_NAME, name);
}

int exit_code_of(ExecutionOutcome const& outcome) {
  switch (outcome.status_) {
  case ExecStatus::Completed:
    return outcome.exit_code_;
  case ExecStatus::Interrupted:
    return constant::SIGNAL_EXIT_CODE_OFFSET + SIGINT;
  case ExecStatus::StrictViolation:
  case ExecStatus::TimedOut:
  case ExecStatus::Failed:
    break;
  }
  return 1;
}

} // namespace

Session::Session(
    Model                          model,
    std::filesystem::path          cache_path,
    std::unique_ptr<CommandRunner> runner,
    crypto::KeyProvider            key_provider
)
    : model_(std::move(model))
    , cache_(std::move(cache_path), true, std::move(key_provider))
    , runner_(std::move(runner))
    , resolver_(model_, cache_, *runner_)
    , matcher_(model_, resolver_)
    , executor_(model_, resolver_, cache_, *runner_) {
  std::error_code ec;
  bool const      existed = std::filesystem::exists(cache_.path(), ec);
  cache_.load();

  if (model_.global_.verbose_) {
    if (existed) {
      fmt::print("[VERBOSE] Loaded cache from: {}\n", cache_.path());
    } else {
      fmt::print("[VERBOSE] Created new cache file: {}\n", cache_.path());
    }
    if (auto history = cache_.history(); !history.empty()) {
      fmt::print("[VERBOSE] Loaded {} history entries\n", history.size());
    }
    if (cache_.needs_migration()) {
      fmt::print("[VERBOSE] Plaintext cache found, it will be encrypted on the next save\n");
    }
  }
}

auto Session::dispatch(Tokens tokens) -> DispatchResult {
  if (tokens.size() == 1 && is_help_flag(tokens.front())) {
    fmt::print("{}", format_global_help(model_));
    return {true, 0};
  }

  auto match = matcher_.find_command(tokens);
  switch (match.state_) {
  case MatchState::Failed:
    return {false, 1};
  case MatchState::HelpRequested:
    fmt::print("{}", format_command_help(match.chain_));
    cache_.save();
    return {true, 0};
  case MatchState::Matched:
    break;
  }

  auto outcome = executor_.execute(match.chain_, match.vars_, match.remaining_);
  cache_.save();
  return {true, exit_code_of(outcome)};
}

auto Session::run_interactive(std::istream& in, bool show_prompt) -> int {
  cache_.purge_expired(model_.ttl_map());

  auto print_prompt = [&] {
    if (show_prompt) {
      fmt::print(stderr, "{}", constant::PROMPT);
      std::fflush(stderr);
    }
  };

  print_prompt();
  std::string raw;
  while (std::getline(in, raw)) {
    auto line = trim(raw);
    if (line.empty()) {
      print_prompt();
      continue;
    }
    if (line == "exit" || line == "quit") {
      break;
    }

    cache_.add_history(line, model_.global_.history_size_);
    cache_.save();

    auto parts = tokenize(line);
    if (!parts) {
      fmt::print(stderr, "Error: {}\n", parts.error());
    } else if (auto result = dispatch(*parts); !result.found_) {
      fmt::print(stderr, "Invalid command.\n");
    }
    print_prompt();
  }
  return 0;
}

App::App() : parser_(cli::create_dya_parser()), is_interactive_(isatty(STDIN_FILENO) != 0) {}

auto App::run(int argc, char** argv) -> int {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return run(args);
}

auto App::run(std::span<std::string const> raw_args) -> int {
  auto args = parser_.parse(raw_args);
  if (!args) {
    fmt::print(stderr, "Error: {}\n", args.error());
    return 1;
  }

  if (args->has(flag("help"))) {
    fmt::print("{}", format_app_help(parser_));
    return 0;
  }

  auto config_path = args->get(flag("config")).transform(expand_home).value_or(default_config_path());
  auto cache_path  = args->get(flag("cache")).transform(expand_home).value_or(default_cache_path());

  if (handle_management(*args, cache_path)) {
    return 0;
  }

  auto const& tokens = args->passthrough_;
  auto        model  = load_model(config_path);
  if (!model) {
    fmt::print(stderr, "Error: {}\n", model.error());
    if (tokens.size() == 1 && is_help_flag(tokens.front())) {
      fmt::print("\n{:=<30}\n", "");
      fmt::print("{}", format_app_help(parser_));
      return 0;
    }
    return 1;
  }

  if (model->global_.verbose_) {
    fmt::print("[VERBOSE] Loaded configuration from: {}\n", config_path);
  }

  Session session(std::move(*model), cache_path, make_shell_runner());
  if (tokens.empty()) {
    return session.run_interactive(std::cin, is_interactive_);
  }

  auto result = session.dispatch(tokens);
  if (!result.found_) {
    fmt::print(stderr, "Error: Command not found.\n");
  }
  return result.exit_code_;
}

auto App::handle_management(cli::Arguments const& args, std::filesystem::path const& cache_path) -> bool {
  bool const clear_cache   = args.has(flag("clear-cache"));
  bool const clear_history = args.has(flag("clear-history"));
  bool const clear_all     = args.has(flag("clear-all"));
  bool const set_locals    = args.has(flag("set-locals"));
  bool const clear_locals  = args.has(flag("clear-locals"));
  if (!clear_cache && !clear_history && !clear_all && !set_locals && !clear_locals) {
    return false;
  }

  CacheStore cache(cache_path);
  cache.load();

  if (clear_all) {
    if (cache.delete_all()) {
      fmt::print("Cache file deleted: {}\n", cache_path);
    } else {
      fmt::print("Cache file not found: {}\n", cache_path);
    }
    return true;
  }

  if (clear_cache) {
    fmt::print("Cleared {} cache entries (history preserved)\n", cache.clear_sources());
  }
  if (clear_history) {
    fmt::print("{}\n", cache.clear_history() ? "Command history cleared" : "No history to clear");
  }
  if (set_locals) {
    auto kv = args.get_all(flag("set-locals"));
    cache.set_local(kv[0], kv[1]);
    fmt::print("Local variable set: {}={}\n", kv[0], kv[1]);
  }
  if (clear_locals) {
    fmt::print("{}\n", cache.clear_locals() ? "Local variables cleared" : "No local variables to clear");
  }
  return true;
}

} // namespace dynalias
