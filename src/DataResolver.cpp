#include "dynalias/DataResolver.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/Util.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <fmt/core.h>
#include <fmt/ranges.h>

namespace dynalias {

namespace {

Rows const EMPTY_ROWS;

// Keeps `name` on the in-progress stack for the guard's lifetime.
class InProgressGuard {
  std::vector<std::string>& stack_;

public:
  InProgressGuard(std::vector<std::string>& stack, std::string const& name) : stack_(stack) {
    stack_.push_back(name);
  }
  ~InProgressGuard() {
    stack_.pop_back();
  }
  InProgressGuard(InProgressGuard const&)            = delete;
  InProgressGuard& operator=(InProgressGuard const&) = delete;
};

std::vector<std::string> source_names(auto const& sources) {
  std::vector<std::string> names;
  for (auto const& s : sources) {
    names.push_back(s.name_);
  }
  return names;
}

} // namespace

auto map_rows(nlohmann::json const& output, std::vector<std::pair<std::string, std::string>> const& mapping)
    -> Rows {
  Rows rows;
  auto map_item = [&](nlohmann::json const& item) {
    if (!item.is_object()) {
      return;
    }
    Row row = Row::object();
    for (auto const& [internal, external] : mapping) {
      auto it = item.find(external);
      if (it != item.end()) {
        row[internal] = *it;
      }
    }
    if (!row.empty()) {
      rows.push_back(std::move(row));
    }
  };

  if (output.is_array()) {
    for (auto const& item : output) {
      map_item(item);
    }
  } else {
    map_item(output);
  }
  return rows;
}

DataResolver::DataResolver(Model const& model, CacheStore& cache, CommandRunner& runner)
    : model_(model), cache_(cache), runner_(runner) {}

auto DataResolver::resolve_one(std::string const& name) -> Rows const& {
  if (auto it = memo_.find(name); it != memo_.end()) {
    return it->second;
  }

  if (auto const* source = model_.find_static(name)) {
    return memo_.emplace(name, source->rows_).first->second;
  }

  if (auto const* source = model_.find_dynamic(name)) {
    return resolve_dynamic(*source);
  }

  fmt::print(stderr, "Warning: Source '{}' not found in dicts or dynamic_dicts\n", name);
  fmt::print(stderr, "  Action: Attempted to resolve data source\n");
  fmt::print(stderr, "  Available dicts: [{}]\n", fmt::join(source_names(model_.statics_), ", "));
  fmt::print(stderr, "  Available dynamic_dicts: [{}]\n", fmt::join(source_names(model_.dynamics_), ", "));
  return EMPTY_ROWS;
}

auto DataResolver::resolve_dynamic(DynamicSource const& source) -> Rows const& {
  auto const& name = source.name_;
  if (std::ranges::find(in_progress_, name) != in_progress_.end()) {
    fmt::print(
        stderr,
        "Warning: Circular reference detected in dynamic dict resolution: {} -> {}\n",
        fmt::join(in_progress_, " -> "),
        name
    );
    return EMPTY_ROWS;
  }

  InProgressGuard guard(in_progress_, name);
  bool const      verbose = model_.global_.verbose_;

  if (auto cached = cache_.get(name, source.cache_ttl_)) {
    if (cached->empty()) {
      fmt::print(stderr, "Warning: dynamic_dict '{}' has empty cached data\n", name);
      fmt::print(stderr, "  Suggestion: Run --dya-clear-cache to refresh\n");
    }
    if (verbose) {
      fmt::print("[VERBOSE] Loaded dynamic_dict '{}' from cache\n", name);
    }
    return memo_.insert_or_assign(name, std::move(*cached)).first->second;
  }

  auto started = std::chrono::steady_clock::now();
  auto rows    = fetch(source);
  if (verbose) {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    fmt::print("[VERBOSE] Executed dynamic_dict '{}' in {:.2f}s\n", name, elapsed.count());
  }

  if (!rows) {
    fmt::print(stderr, "{}\n", rows.error());
    return memo_.insert_or_assign(name, Rows{}).first->second;
  }

  if (rows->empty()) {
    fmt::print(stderr, "Warning: dynamic_dict '{}' returned empty list\n", name);
    fmt::print(stderr, "  Action: Executed command for dynamic resolution\n");
    fmt::print(stderr, "  Command: {}\n", preview(source.command_, constant::COMMAND_PREVIEW_LENGTH));
  }
  cache_.set(name, *rows);
  cache_.save();
  return memo_.insert_or_assign(name, std::move(*rows)).first->second;
}

auto DataResolver::fetch(DynamicSource const& source) -> Result<Rows> {
  auto const& name = source.name_;

  // Dependencies first, each looked up once, so a cycle is reported once.
  std::unordered_map<std::string, Rows const*> dependencies;
  for (auto const& ref : extract_app_vars(source.command_)) {
    if (ref.source_ != constant::LOCALS_SOURCE && !dependencies.contains(ref.source_)) {
      dependencies.emplace(ref.source_, &resolve_one(ref.source_));
    }
  }
  SourceLookup lookup = [&](std::string const& dependency) -> Rows const& {
    auto it = dependencies.find(dependency);
    return it != dependencies.end() ? *it->second : resolve_one(dependency);
  };

  auto command = resolve_app_vars(source.command_, lookup, {}, locals_lookup(), model_.global_.verbose_);

  auto result = runner_.run(command, std::chrono::seconds(source.timeout_), OutputMode::Capture);
  if (!result) {
    auto const& err = result.error();
    if (err.kind() == ProcessError::Kind::TimedOut) {
      return std::unexpected(
          fmt::format("Error in dynamic dict '{}': Command timed out after {}s", name, source.timeout_)
      );
    }
    return std::unexpected(fmt::format("Error in dynamic dict '{}': {}", name, err.message()));
  }

  if (result->exit_code_ != 0) {
    return std::unexpected(
        fmt::format("Error executing dynamic dict '{}': {}", name, trim(result->stderr_))
    );
  }

  auto cmd_preview = preview(command, constant::COMMAND_PREVIEW_LENGTH);
  auto output      = trim(result->stdout_);
  if (output.empty()) {
    return std::unexpected(fmt::format(
        "Error in dynamic dict '{}': Command produced no output\n"
        "  Command: {}\n"
        "  Expected: Valid JSON array or object",
        name,
        cmd_preview
    ));
  }

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(output);
  } catch (nlohmann::json::parse_error const& e) {
    return std::unexpected(fmt::format(
        "Error in dynamic dict '{}': Invalid JSON output\n"
        "  Command: {}\n"
        "  JSON Error: {}\n"
        "  Output: {}",
        name,
        cmd_preview,
        e.what(),
        preview(output, constant::OUTPUT_PREVIEW_LENGTH)
    ));
  }

  return map_rows(parsed, source.mapping_);
}

void DataResolver::resolve_all() {
  for (auto const& source : model_.statics_) {
    resolve_one(source.name_);
  }
  for (auto const& source : model_.dynamics_) {
    resolve_one(source.name_);
  }
}

auto DataResolver::source_lookup() -> SourceLookup {
  return [this](std::string const& name) -> Rows const& { return resolve_one(name); };
}

auto DataResolver::locals_lookup() const -> LocalsLookup {
  return [this](std::string const& key) { return cache_.get_local(key); };
}

bool DataResolver::is_memoized(std::string const& name) const {
  return memo_.contains(name);
}

std::vector<std::string> const& DataResolver::in_progress() const noexcept {
  return in_progress_;
}

} // namespace dynalias
