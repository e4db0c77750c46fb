#pragma once

#include "dynalias/Model.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dynalias {

// $${source.key} or $${source[N].key}
struct AppVarRef {
  std::string                source_;
  std::optional<std::size_t> index_;
  std::string                key_;

  bool operator==(AppVarRef const&) const = default;
};

using SourceLookup = std::function<Rows const&(std::string const&)>;
using LocalsLookup = std::function<std::optional<std::string>(std::string const&)>;

// Whole-token classification used by the alias matcher.
[[nodiscard]] auto parse_app_var(std::string_view token) -> std::optional<AppVarRef>;
[[nodiscard]] auto parse_user_var(std::string_view token) -> std::optional<std::string>;

// Every app variable reference in the text, in order of appearance, without
// duplicates.
[[nodiscard]] auto extract_app_vars(std::string_view text) -> std::vector<AppVarRef>;

// Replace app variables. Resolution order per reference:
//   1. source "locals": locals lookup
//   2. source bound in `vars` and no explicit index: the bound row
//   3. otherwise rows[index or 0] of the lazily resolved source
// Placeholders that cannot be resolved stay in the output unchanged.
[[nodiscard]] auto resolve_app_vars(
    std::string_view    text,
    SourceLookup const& source_lookup,
    Variables const&    vars          = {},
    LocalsLookup const& locals_lookup = nullptr,
    bool                verbose       = false
) -> std::string;

// Replace ${name} with the string bound to name; anything else stays.
[[nodiscard]] auto resolve_user_vars(std::string_view text, Variables const& vars) -> std::string;

// Textual form of a row field: strings as-is, everything else as JSON.
[[nodiscard]] auto display_value(nlohmann::json const& value) -> std::string;

} // namespace dynalias
