#include "dynalias/AliasMatcher.hpp"
#include "dynalias/Template.hpp"
#include "dynalias/Util.hpp"

#include <algorithm>

namespace dynalias {

namespace {

MatchResult help_result(Chain chain, Variables vars) {
  return MatchResult{MatchState::HelpRequested, std::move(chain), std::move(vars), {}};
}

void merge_vars(Variables& into, Variables&& from) {
  for (auto& [name, value] : from) {
    into.insert_or_assign(name, std::move(value));
  }
}

} // namespace

bool is_help_flag(std::string_view token) {
  return token == "-h" || token == "--help";
}

AliasMatcher::AliasMatcher(Model const& model, DataResolver& resolver) : model_(model), resolver_(resolver) {}

auto AliasMatcher::match_alias_parts(Tokens alias, Tokens input) -> PartsMatch {
  PartsMatch result;
  auto const paired = std::min(alias.size(), input.size());

  for (size_t i = 0; i < paired; ++i) {
    auto const& pattern = alias[i];
    auto const& token   = input[i];

    if (auto ref = parse_app_var(pattern)) {
      if (is_help_flag(token)) {
        result.matched_ = true;
        result.help_    = true;
        return result;
      }
      Rows const& rows = resolver_.resolve_one(ref->source_);
      auto        row  = std::ranges::find_if(rows, [&](Row const& r) {
        if (!r.is_object()) {
          return false;
        }
        auto field = r.find(ref->key_);
        return field != r.end() && display_value(*field) == token;
      });
      if (row == rows.end()) {
        return {};
      }
      result.vars_.insert_or_assign(ref->source_, *row);
      continue;
    }

    if (auto name = parse_user_var(pattern)) {
      if (is_help_flag(token)) {
        result.matched_ = true;
        result.help_    = true;
        return result;
      }
      result.vars_.insert_or_assign(*name, token);
      continue;
    }

    if (pattern != token) {
      return {};
    }
  }

  if (input.size() < alias.size()) {
    return {};
  }
  result.matched_ = true;
  return result;
}

auto AliasMatcher::try_match(CommandNode const& node, Tokens args) -> MatchResult {
  auto const alias = split_words(node.alias());
  auto const head  = args.first(std::min(alias.size(), args.size()));

  auto parts = match_alias_parts(alias, head);
  if (parts.help_) {
    return help_result({&node}, std::move(parts.vars_));
  }
  if (!parts.matched_) {
    return {};
  }

  Chain     chain{&node};
  Variables vars      = std::move(parts.vars_);
  Tokens    remaining = args.subspan(alias.size());

  // Greedy arg consumption: first variant that matches wins, then start over.
  while (!remaining.empty() && !node.args_.empty()) {
    bool consumed = false;
    for (auto const& arg : node.args_) {
      for (auto const& variant : arg.aliases_) {
        auto const arg_alias = split_words(variant);
        auto       arg_head  = remaining.first(std::min(arg_alias.size(), remaining.size()));
        auto       arg_parts = match_alias_parts(arg_alias, arg_head);

        if (arg_parts.help_) {
          merge_vars(vars, std::move(arg_parts.vars_));
          chain.push_back(&arg);
          return help_result(std::move(chain), std::move(vars));
        }
        if (arg_parts.matched_) {
          merge_vars(vars, std::move(arg_parts.vars_));
          chain.push_back(&arg);
          remaining = remaining.subspan(arg_alias.size());
          consumed  = true;
          break;
        }
      }
      if (consumed) {
        break;
      }
    }
    if (!consumed) {
      break;
    }
  }

  if (!remaining.empty()) {
    for (auto const& sub : node.sub_) {
      auto sub_result = try_match(sub, remaining);
      if (!sub_result.matched()) {
        continue;
      }
      merge_vars(vars, std::move(sub_result.vars_));
      chain.insert(chain.end(), sub_result.chain_.begin(), sub_result.chain_.end());
      sub_result.chain_ = std::move(chain);
      sub_result.vars_  = std::move(vars);
      return sub_result;
    }
  }

  if (!remaining.empty() && is_help_flag(remaining.front())) {
    return help_result(std::move(chain), std::move(vars));
  }

  return MatchResult{
      MatchState::Matched,
      std::move(chain),
      std::move(vars),
      std::vector<std::string>(remaining.begin(), remaining.end())
  };
}

auto AliasMatcher::find_command(Tokens args) -> MatchResult {
  for (auto const& command : model_.commands_) {
    auto result = try_match(command, args);
    if (result.matched()) {
      return result;
    }
  }
  return {};
}

} // namespace dynalias
