#include "dynalias/Cli.hpp"
#include "dynalias/Constants.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace dynalias::cli {

Option::Option(std::string long_name, std::string description, std::size_t arity, std::string value_names)
    : long_name_(std::move(long_name))
    , description_(std::move(description))
    , value_names_(std::move(value_names))
    , arity_(arity) {}

bool Arguments::has(std::string const& name) const noexcept {
  return values_.contains(name);
}

auto Arguments::get(std::string const& name) const -> std::optional<std::string> {
  if (auto it = values_.find(name); it != values_.end() && !it->second.empty()) {
    return it->second.front();
  }
  return std::nullopt;
}

auto Arguments::get_all(std::string const& name) const -> std::vector<std::string> {
  if (auto it = values_.find(name); it != values_.end()) {
    return it->second;
  }
  return {};
}

ArgumentParser::ArgumentParser(std::string program_name) : program_name_(std::move(program_name)) {}

auto ArgumentParser::add_option(std::string long_name, std::string description, std::size_t arity, std::string value_names)
    -> Option& {
  option_map_[long_name] = options_.size();
  return options_.emplace_back(std::move(long_name), std::move(description), arity, std::move(value_names));
}

auto ArgumentParser::parse(int argc, char** argv) const -> Result<Arguments> {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? argc - 1 : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(std::span<std::string const>(args));
}

auto ArgumentParser::parse(std::span<std::string const> args) const -> Result<Arguments> {
  Arguments result;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string const& arg = args[i];

    auto it = arg.starts_with("--") ? option_map_.find(arg.substr(2)) : option_map_.end();
    if (it == option_map_.end()) {
      result.passthrough_.push_back(arg);
      continue;
    }

    Option const& option = options_[it->second];
    auto&         values = result.values_[option.long_name()];
    if (option.arity() == 0) {
      values.emplace_back("true");
      continue;
    }

    if (i + option.arity() >= args.size()) {
      return std::unexpected(fmt::format("{} requires {}", arg, option.value_names()));
    }
    // Repeated options keep the last occurrence.
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1), args.begin() + static_cast<std::ptrdiff_t>(i + 1 + option.arity()));
    i += option.arity();
  }

  return result;
}

std::string ArgumentParser::generate_help() const {
  auto label = [](Option const& option) {
    return option.value_names().empty() ? fmt::format("--{}", option.long_name())
                                        : fmt::format("--{} {}", option.long_name(), option.value_names());
  };

  size_t width = std::string_view("-h, --help").size();
  for (auto const& option : options_) {
    width = std::max(width, label(option).size());
  }

  std::string out = fmt::format("Usage: {} [options] [alias tokens...]\n\nReserved Arguments:\n", program_name_);
  out += fmt::format("  {:<{}} : {}\n", "-h, --help", width, "Display help for commands or global help");
  for (auto const& option : options_) {
    out += fmt::format("  {:<{}} : {}\n", label(option), width, option.description());
  }
  return out;
}

auto create_dya_parser() -> ArgumentParser {
  auto prefix = [](std::string_view name) { return fmt::format("{}-{}", constant::EXE_NAME, name); };

  ArgumentParser parser{std::string(constant::EXE_NAME)};
  parser.add_option(prefix("config"), "Specify custom configuration file", 1, "<path>");
  parser.add_option(prefix("cache"), "Specify custom cache file", 1, "<path>");
  parser.add_option(prefix("clear-cache"), "Clear dynamic dict cache (keeps history)");
  parser.add_option(prefix("clear-history"), "Clear command history");
  parser.add_option(prefix("clear-all"), "Delete entire cache file");
  parser.add_option(prefix("set-locals"), "Set a local variable", 2, "<key> <value>");
  parser.add_option(prefix("clear-locals"), "Clear all local variables");
  parser.add_option(prefix("help"), "Display this command line builder help");
  return parser;
}

} // namespace dynalias::cli
