#include "dynalias/Config.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/Util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <fmt/core.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

namespace dynalias {

namespace {

using Json = nlohmann::ordered_json;

constexpr std::array<std::string_view, 4> CONFIG_CANDIDATES{".dya.json", "dya.json", "~/.dya.json", "~/dya.json"};
constexpr std::array<std::string_view, 4> CACHE_CANDIDATES{
    ".dya.cache.json",
    "dya.cache.json",
    "~/.dya.cache.json",
    "~/dya.cache.json"
};

std::string describe(Json const& block) {
  auto name = block.find("name");
  if (name != block.end() && name->is_string()) {
    return fmt::format("{} '{}'", block.value("type", std::string("block")), name->get<std::string>());
  }
  return block.value("type", std::string("block"));
}

Result<std::string> required_string(Json const& block, char const* key) {
  auto it = block.find(key);
  if (it == block.end()) {
    return std::unexpected(fmt::format("{}: missing required field '{}'", describe(block), key));
  }
  if (!it->is_string()) {
    return std::unexpected(fmt::format("{}: field '{}' must be a string", describe(block), key));
  }
  return it->get<std::string>();
}

std::optional<std::string> optional_string(Json const& block, char const* key) {
  auto it = block.find(key);
  if (it == block.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

Row to_row(Json const& item) {
  Row row = Row::object();
  for (auto const& [key, value] : item.items()) {
    if (value.is_string()) {
      row[key] = substitute_env(value.get<std::string>());
    } else {
      row[key] = Row::parse(value.dump());
    }
  }
  return row;
}

void parse_global(Json const& cfg, GlobalConfig& global) {
  if (!cfg.is_object()) {
    return;
  }
  if (cfg.contains("history-size")) {
    auto size              = std::max<std::int64_t>(cfg["history-size"].get<std::int64_t>(), 0);
    global.history_size_   = std::min(static_cast<std::size_t>(size), constant::MAX_HISTORY_SIZE);
  }
  global.verbose_ = cfg.value("verbose", global.verbose_);
}

Result<StaticSource> parse_dict(Json const& block) {
  auto name = required_string(block, "name");
  if (!name) {
    return std::unexpected(name.error());
  }
  StaticSource source{*name, {}};
  auto         data = block.find("data");
  if (data == block.end()) {
    return source;
  }
  if (!data->is_array()) {
    return std::unexpected(fmt::format("{}: 'data' must be an array of objects", describe(block)));
  }
  for (auto const& item : *data) {
    if (!item.is_object()) {
      return std::unexpected(fmt::format("{}: 'data' must be an array of objects", describe(block)));
    }
    source.rows_.push_back(to_row(item));
  }
  return source;
}

Result<DynamicSource> parse_dynamic(Json const& block) {
  auto name    = required_string(block, "name");
  auto command = name ? required_string(block, "command") : Result<std::string>(std::unexpected(name.error()));
  if (!command) {
    return std::unexpected(command.error());
  }

  auto mapping = block.find("mapping");
  if (mapping == block.end() || !mapping->is_object()) {
    return std::unexpected(fmt::format("{}: missing required field 'mapping'", describe(block)));
  }

  DynamicSource source;
  source.name_    = *name;
  source.command_ = *command;
  for (auto const& [internal, external] : mapping->items()) {
    if (!external.is_string()) {
      return std::unexpected(fmt::format("{}: mapping '{}' must be a string", describe(block), internal));
    }
    source.mapping_.emplace_back(internal, external.get<std::string>());
  }
  source.priority_  = block.value("priority", constant::DEFAULT_SOURCE_PRIORITY);
  source.timeout_   = block.value("timeout", constant::DEFAULT_SOURCE_TIMEOUT);
  source.cache_ttl_ = block.value("cache-ttl", constant::DEFAULT_CACHE_TTL);
  return source;
}

Result<CommandNode> parse_node(Json const& block, NodeKind kind) {
  if (!block.is_object()) {
    return std::unexpected("command entries must be objects");
  }

  CommandNode node;
  node.kind_ = kind;

  if (kind == NodeKind::Command) {
    auto name = required_string(block, "name");
    if (!name) {
      return std::unexpected(name.error());
    }
    node.name_ = *name;
  }

  auto alias = block.find("alias");
  if (alias == block.end()) {
    return std::unexpected(fmt::format("{}: missing required field 'alias'", describe(block)));
  }
  if (alias->is_string()) {
    node.aliases_.push_back(alias->get<std::string>());
  } else if (alias->is_array() && kind == NodeKind::Arg) {
    for (auto const& variant : *alias) {
      node.aliases_.push_back(variant.get<std::string>());
    }
  } else {
    return std::unexpected(fmt::format("{}: field 'alias' must be a string", describe(block)));
  }

  auto command = required_string(block, "command");
  if (!command) {
    return std::unexpected(command.error());
  }
  node.command_ = *command;
  node.helper_  = optional_string(block, "helper");

  if (kind == NodeKind::Arg) {
    return node;
  }

  node.set_locals_ = block.value("set-locals", false);

  auto parse_children = [&](char const* field, NodeKind child_kind, std::vector<CommandNode>& children) -> Result<void> {
    auto it = block.find(field);
    if (it == block.end()) {
      return {};
    }
    if (!it->is_array()) {
      return std::unexpected(fmt::format("{}: '{}' must be an array", describe(block), field));
    }
    for (auto const& child : *it) {
      auto parsed = parse_node(child, child_kind);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      children.push_back(std::move(*parsed));
    }
    return {};
  };

  if (auto ok = parse_children("sub", NodeKind::SubCommand, node.sub_); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = parse_children("args", NodeKind::Arg, node.args_); !ok) {
    return std::unexpected(ok.error());
  }

  if (kind == NodeKind::Command) {
    node.timeout_ = block.value("timeout", 0);
    node.strict_  = block.value("strict", false);
    auto helper_type = block.value("helper-type", std::string("auto"));
    if (helper_type != "auto" && helper_type != "custom") {
      return std::unexpected(
          fmt::format("{}: 'helper-type' must be \"auto\" or \"custom\", got \"{}\"", describe(block), helper_type)
      );
    }
    node.helper_type_ = helper_type == "custom" ? HelperType::Custom : HelperType::Auto;
  }
  return node;
}

Result<void> check_source_names(Model const& model) {
  std::set<std::string> seen;
  auto                  check = [&](std::string const& name) -> Result<void> {
    if (name == constant::LOCALS_SOURCE) {
      return std::unexpected(fmt::format("source name '{}' is reserved", name));
    }
    if (!seen.insert(name).second) {
      return std::unexpected(fmt::format("duplicate source name '{}'", name));
    }
    return {};
  };
  for (auto const& s : model.statics_) {
    if (auto ok = check(s.name_); !ok) {
      return ok;
    }
  }
  for (auto const& s : model.dynamics_) {
    if (auto ok = check(s.name_); !ok) {
      return ok;
    }
  }
  return {};
}

Result<Model> build_model(Json const& doc) {
  if (!doc.is_array()) {
    return std::unexpected("config must be a JSON array of blocks");
  }

  Model model;
  for (auto const& block : doc) {
    if (!block.is_object()) {
      continue;
    }
    if (block.contains("config")) {
      parse_global(block["config"], model.global_);
      continue;
    }

    auto type = block.value("type", std::string{});
    if (type == "dict") {
      auto source = parse_dict(block);
      if (!source) {
        return std::unexpected(source.error());
      }
      model.statics_.push_back(std::move(*source));
    } else if (type == "dynamic_dict") {
      auto source = parse_dynamic(block);
      if (!source) {
        return std::unexpected(source.error());
      }
      model.dynamics_.push_back(std::move(*source));
    } else if (type == "command") {
      auto command = parse_node(block, NodeKind::Command);
      if (!command) {
        return std::unexpected(command.error());
      }
      model.commands_.push_back(std::move(*command));
    }
  }

  if (auto ok = check_source_names(model); !ok) {
    return std::unexpected(ok.error());
  }
  std::ranges::stable_sort(model.dynamics_, {}, &DynamicSource::priority_);
  return model;
}

} // namespace

auto parse_model(std::string_view text) -> Result<Model> {
  // Editors on some platforms write a byte order mark.
  if (text.starts_with("\xEF\xBB\xBF")) {
    text.remove_prefix(3);
  }

  Json doc = Json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    return std::unexpected("Invalid JSON in config file");
  }

  try {
    return build_model(doc);
  } catch (nlohmann::json::exception const& e) {
    return std::unexpected(fmt::format("Invalid config: {}", e.what()));
  }
}

auto load_model(std::filesystem::path const& path) -> Result<Model> {
  std::ifstream in(path);
  if (!in.is_open()) {
    return std::unexpected(fmt::format("Config file not found at {}", path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_model(buffer.str());
}

auto substitute_env(std::string_view text) -> std::string {
  constexpr std::string_view open = "$${env.";

  std::string out;
  size_t      pos = 0;
  while (pos < text.size()) {
    size_t found = text.find(open, pos);
    if (found == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, found - pos));

    size_t name_begin = found + open.size();
    size_t name_end   = name_begin;
    while (name_end < text.size() && (std::isalnum(static_cast<unsigned char>(text[name_end])) || text[name_end] == '_')) {
      ++name_end;
    }
    if (name_end == name_begin || name_end >= text.size() || text[name_end] != '}') {
      out.push_back(text[found]);
      pos = found + 1;
      continue;
    }

    std::string name(text.substr(name_begin, name_end - name_begin));
    if (char const* value = std::getenv(name.c_str())) {
      out.append(value);
    }
    pos = name_end + 1;
  }
  return out;
}

auto default_config_path() -> std::filesystem::path {
  return first_existing(CONFIG_CANDIDATES, "~/.dya.json");
}

auto default_cache_path() -> std::filesystem::path {
  return first_existing(CACHE_CANDIDATES, "~/.dya.cache.json");
}

} // namespace dynalias
