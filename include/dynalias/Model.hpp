#pragma once

#include "dynalias/Constants.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace dynalias {

// A row is always a JSON object; sources are ordered sequences of rows.
using Row  = nlohmann::json;
using Rows = std::vector<Row>;

enum class NodeKind {
  Command,    // root of a chain, carries timeout/strict/helper type
  SubCommand, // nested command, inherits root-only settings
  Arg         // modifier, several alias variants, never nests
};

enum class HelperType { Auto, Custom };

struct CommandNode {
  NodeKind                   kind_ = NodeKind::Command;
  std::string                name_;
  std::vector<std::string>   aliases_;
  std::string                command_;
  std::optional<std::string> helper_;
  std::vector<CommandNode>   sub_;
  std::vector<CommandNode>   args_;
  bool                       set_locals_ = false;

  // Only read on the root of a chain
  int        timeout_     = 0;
  bool       strict_      = false;
  HelperType helper_type_ = HelperType::Auto;

  [[nodiscard]] auto alias() const -> std::string const&;
};

// Matched path through the command tree: root first, then args/subs in the
// order they consumed tokens. Nodes are owned by the Model.
using Chain = std::vector<CommandNode const*>;

[[nodiscard]] auto chain_root(Chain const& chain) -> CommandNode const*;
[[nodiscard]] auto chain_is_strict(Chain const& chain) -> bool;
[[nodiscard]] auto chain_timeout(Chain const& chain) -> int;
[[nodiscard]] auto chain_helper_type(Chain const& chain) -> HelperType;
[[nodiscard]] auto chain_sets_locals(Chain const& chain) -> bool;
[[nodiscard]] auto chain_template(Chain const& chain) -> std::string;

struct StaticSource {
  std::string name_;
  Rows        rows_;
};

struct DynamicSource {
  std::string                                      name_;
  std::string                                      command_;
  std::vector<std::pair<std::string, std::string>> mapping_; // internal -> external key
  int                                              priority_  = constant::DEFAULT_SOURCE_PRIORITY;
  int                                              timeout_   = constant::DEFAULT_SOURCE_TIMEOUT;
  std::int64_t                                     cache_ttl_ = constant::DEFAULT_CACHE_TTL;
};

struct GlobalConfig {
  std::size_t history_size_ = constant::DEFAULT_HISTORY_SIZE;
  bool        verbose_      = false;
};

// Immutable once built; every component only reads it.
struct Model {
  std::vector<StaticSource>  statics_;
  std::vector<DynamicSource> dynamics_; // ascending priority
  std::vector<CommandNode>   commands_;
  GlobalConfig               global_;

  [[nodiscard]] auto find_static(std::string_view name) const -> StaticSource const*;
  [[nodiscard]] auto find_dynamic(std::string_view name) const -> DynamicSource const*;
  [[nodiscard]] auto ttl_map() const -> std::unordered_map<std::string, std::int64_t>;
};

// Values bound while matching an alias: raw typed tokens for ${name},
// the selected row for $${source.key}.
using BoundValue = std::variant<std::string, Row>;
using Variables  = std::map<std::string, BoundValue>;

} // namespace dynalias
