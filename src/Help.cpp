#include "dynalias/Help.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/Util.hpp"

#include <algorithm>
#include <iterator>
#include <fmt/core.h>
#include <fmt/ranges.h>

namespace dynalias {

namespace {

constexpr std::string_view NO_HELP     = "No helper information available for this command.";
constexpr size_t           MIN_SPACING = 2;
constexpr size_t           MAX_SPACING = 20;

std::string footer() {
  return fmt::format(
      "\nCommand Line Interface powered by Dynamic Alias\nTo display {0} helper use --{0}-help\n",
      constant::EXE_NAME
  );
}

std::vector<std::string> helper_lines(CommandNode const& node) {
  if (!node.helper_) {
    return {};
  }
  std::vector<std::string> lines;
  auto const               body = trim(*node.helper_);
  std::string_view         text = body;
  size_t                   pos  = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(pos));
      break;
    }
    lines.emplace_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return lines;
}

std::string first_word(std::string const& alias) {
  auto words = split_words(alias);
  return words.empty() ? alias : words.front();
}

std::string matched_path(Chain const& chain) {
  std::vector<std::string> parts;
  for (auto const* node : chain) {
    if (node->kind_ != NodeKind::Arg) {
      parts.push_back(node->alias());
    }
  }
  return fmt::format("{}", fmt::join(parts, " "));
}

std::string optional_section(CommandNode const& node) {
  std::vector<std::string> parts;

  std::vector<std::string> flags;
  for (auto const& arg : node.args_) {
    for (auto const& variant : arg.aliases_) {
      flags.push_back(first_word(variant));
    }
  }
  if (!flags.empty()) {
    parts.push_back(fmt::format("[{}]", fmt::join(flags, " | ")));
  }

  std::vector<std::string> subs;
  for (auto const& sub : node.sub_) {
    auto nested = optional_section(sub);
    subs.push_back(nested.empty() ? sub.alias() : fmt::format("{} {}", sub.alias(), nested));
  }
  if (!subs.empty()) {
    parts.push_back(fmt::format("[{}]", fmt::join(subs, " | ")));
  }
  return fmt::format("{}", fmt::join(parts, " "));
}

void append_entry(std::string& out, std::string const& label, CommandNode const& node) {
  auto lines   = helper_lines(node);
  auto spacing = std::clamp(MAX_SPACING > label.size() ? MAX_SPACING - label.size() : 0, MIN_SPACING, MAX_SPACING);
  out += fmt::format("        {}", label);
  if (lines.empty()) {
    out += "\n";
    return;
  }
  out += fmt::format("{:{}}{}\n", "", spacing, lines.front());
  std::string const indent(8 + label.size() + spacing, ' ');
  for (size_t i = 1; i < lines.size(); ++i) {
    out += fmt::format("{}{}\n", indent, lines[i]);
  }
}

} // namespace

auto format_custom_help(Chain const& chain) -> std::string {
  std::vector<std::string> blocks;
  for (auto const* node : chain) {
    if (node->helper_) {
      blocks.push_back(trim(*node->helper_));
    }
  }
  if (blocks.empty()) {
    return std::string(NO_HELP);
  }
  return fmt::format("{}", fmt::join(blocks, "\n\n"));
}

auto format_auto_help(Chain const& chain) -> std::string {
  auto target_it = std::ranges::find_if(chain.rbegin(), chain.rend(), [](CommandNode const* node) {
    return node->kind_ != NodeKind::Arg;
  });
  if (target_it == chain.rend()) {
    return std::string(NO_HELP);
  }
  CommandNode const& target = **target_it;
  auto const         path   = matched_path(chain);

  std::string out = fmt::format("{}\n\n    Description:\n", path);
  auto        description = helper_lines(target);
  if (description.empty()) {
    out += "        No description available.\n";
  }
  for (auto const& line : description) {
    out += fmt::format("        {}\n", line);
  }

  auto optional = optional_section(target);
  out += fmt::format("\n    Usage:\n        {}{}{}\n", path, optional.empty() ? "" : " ", optional);

  if (!target.args_.empty()) {
    out += "\n    Args:\n";
    for (auto const& arg : target.args_) {
      std::vector<std::string> labels;
      std::ranges::transform(arg.aliases_, std::back_inserter(labels), first_word);
      append_entry(out, arg.aliases_.size() > 1 ? fmt::format("{}", fmt::join(labels, ", ")) : arg.alias(), arg);
    }
  }

  if (!target.sub_.empty()) {
    out += "\n    Options/Subcommands:\n";
    for (auto const& sub : target.sub_) {
      append_entry(out, sub.alias(), sub);
    }
  }

  if (out.ends_with('\n')) {
    out.pop_back();
  }
  return out;
}

auto format_command_help(Chain const& chain) -> std::string {
  auto body = chain_helper_type(chain) == HelperType::Custom ? format_custom_help(chain) : format_auto_help(chain);
  return fmt::format("\nHELPER\n\n{}\n{}", body, footer());
}

auto format_global_help(Model const& model) -> std::string {
  std::string out = fmt::format("\n{} Helper\n\n", constant::APP_NAME);

  if (!model.statics_.empty()) {
    out += "Dicts (Static):\n";
    for (auto const& source : model.statics_) {
      out += fmt::format("  - {}\n", source.name_);
    }
    out += "\n";
  }

  if (!model.dynamics_.empty()) {
    out += "Dynamic Dicts:\n";
    for (auto const& source : model.dynamics_) {
      out += fmt::format("  - {}\n", source.name_);
    }
    out += "\n";
  }

  if (!model.commands_.empty()) {
    out += "Commands:\n";
    for (auto const& command : model.commands_) {
      out += fmt::format("  {} (alias: {})\n", command.name_, command.alias());
      for (auto const& line : helper_lines(command)) {
        out += fmt::format("    {}\n", line);
      }
      out += fmt::format("{:-<20}\n", "");
    }
  }

  return out + footer();
}

auto format_app_help(cli::ArgumentParser const& parser) -> std::string {
  std::string out = fmt::format("\n{} Application Help\n{:-<30}\n", constant::APP_NAME, "");
  out += "Usage Rules:\n"
         "  - Configuration is a JSON array of blocks.\n"
         "  - Supports static dicts, dynamic dicts (via shell commands), and commands.\n"
         "  - Commands can use variables from user input values ${var} or dicts/dynamic_dicts "
         "$${source.key} syntax.\n"
         "  - Supports persistent local variables via $${locals.key} syntax.\n"
         "\nConfiguration Example:\n"
         "  [\n"
         "    {\"type\": \"command\", \"name\": \"Hello World\", \"alias\": \"hello\",\n"
         "     \"command\": \"echo 'Hello World'\"}\n"
         "  ]\n\n";
  return out + parser.generate_help();
}

} // namespace dynalias
