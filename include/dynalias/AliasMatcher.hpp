#pragma once

#include "dynalias/DataResolver.hpp"
#include "dynalias/Model.hpp"

#include <span>
#include <string>
#include <vector>

namespace dynalias {

using Tokens = std::span<std::string const>;

// Outcome of pairing one alias pattern with the head of the input.
struct PartsMatch {
  bool      matched_ = false;
  Variables vars_;
  bool      help_ = false;
};

enum class MatchState { Matched, HelpRequested, Failed };

struct MatchResult {
  MatchState               state_ = MatchState::Failed;
  Chain                    chain_;
  Variables                vars_;
  std::vector<std::string> remaining_;

  [[nodiscard]] bool matched() const noexcept {
    return state_ != MatchState::Failed;
  }
};

// Walks the command tree. First match in declaration order wins; consumed
// args are never given back.
class AliasMatcher {
  Model const&  model_;
  DataResolver& resolver_;

public:
  AliasMatcher(Model const& model, DataResolver& resolver);

  // Pair alias tokens with input tokens positionally. "-h"/"--help" against a
  // variable token stops the scan and requests help; against a static token
  // it is an ordinary mismatch.
  auto match_alias_parts(Tokens alias, Tokens input) -> PartsMatch;

  auto try_match(CommandNode const& node, Tokens args) -> MatchResult;
  auto find_command(Tokens args) -> MatchResult;
};

[[nodiscard]] bool is_help_flag(std::string_view token);

} // namespace dynalias
