#pragma once

#include "dynalias/Model.hpp"
#include "dynalias/Result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace dynalias {

// Build the model from a JSON array of blocks:
//   {"config": {...}}
//   {"type": "dict", ...} | {"type": "dynamic_dict", ...} | {"type": "command", ...}
// Unknown block types are skipped.
auto parse_model(std::string_view text) -> Result<Model>;
auto load_model(std::filesystem::path const& path) -> Result<Model>;

// Replace $${env.NAME} with the environment value (empty when unset).
auto substitute_env(std::string_view text) -> std::string;

auto default_config_path() -> std::filesystem::path;
auto default_cache_path() -> std::filesystem::path;

} // namespace dynalias
