#pragma once

#include "dynalias/CacheStore.hpp"
#include "dynalias/Model.hpp"
#include "dynalias/Process.hpp"
#include "dynalias/Result.hpp"
#include "dynalias/Template.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace dynalias {

// Lazy, memoized resolution of named sources.
//
// Static sources are returned verbatim. Dynamic sources are read from the
// cache while their TTL holds, otherwise their command runs (after its own
// $${source.key} references are resolved through this resolver) and the
// mapped rows are cached and saved. Every failure degrades to empty rows with
// a diagnostic. A source that is reached again while it is being resolved is
// a cycle: the inner lookup yields empty rows and is not memoized.
class DataResolver {
  Model const&                          model_;
  CacheStore&                           cache_;
  CommandRunner&                        runner_;
  std::unordered_map<std::string, Rows> memo_;
  std::vector<std::string>              in_progress_;

public:
  DataResolver(Model const& model, CacheStore& cache, CommandRunner& runner);

  DataResolver(DataResolver const&)            = delete;
  DataResolver& operator=(DataResolver const&) = delete;

  // The returned reference stays valid for the lifetime of the resolver.
  auto resolve_one(std::string const& name) -> Rows const&;
  // Statics first, then dynamics in ascending priority.
  void resolve_all();

  [[nodiscard]] auto source_lookup() -> SourceLookup;
  [[nodiscard]] auto locals_lookup() const -> LocalsLookup;

  [[nodiscard]] bool                            is_memoized(std::string const& name) const;
  [[nodiscard]] std::vector<std::string> const& in_progress() const noexcept;

private:
  auto resolve_dynamic(DynamicSource const& source) -> Rows const&;
  auto fetch(DynamicSource const& source) -> Result<Rows>;
};

// Project raw command output rows through an internal -> external key mapping.
// A bare object counts as one row; rows that map to nothing are dropped.
[[nodiscard]] auto map_rows(
    nlohmann::json const&                                   output,
    std::vector<std::pair<std::string, std::string>> const& mapping
) -> Rows;

} // namespace dynalias
