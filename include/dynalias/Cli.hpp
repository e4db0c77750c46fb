#pragma once

#include "dynalias/Result.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace dynalias::cli {

class Option {
  std::string long_name_;
  std::string description_;
  std::string value_names_;
  std::size_t arity_ = 0;

public:
  Option(std::string long_name, std::string description, std::size_t arity = 0, std::string value_names = "");

  [[nodiscard]] std::string const& long_name() const noexcept {
    return long_name_;
  }
  [[nodiscard]] std::string const& description() const noexcept {
    return description_;
  }
  [[nodiscard]] std::string const& value_names() const noexcept {
    return value_names_;
  }
  [[nodiscard]] std::size_t arity() const noexcept {
    return arity_;
  }
};

class Arguments {
  std::unordered_map<std::string, std::vector<std::string>> values_;

public:
  // Everything that was not a registered option, in order.
  std::vector<std::string> passthrough_;

  [[nodiscard]] bool has(std::string const& name) const noexcept;
  [[nodiscard]] auto get(std::string const& name) const -> std::optional<std::string>;
  [[nodiscard]] auto get_all(std::string const& name) const -> std::vector<std::string>;

  friend class ArgumentParser;
};

// Reserved-flag parser. Registered options may appear anywhere; any other
// token, dashes included, is passed through untouched.
class ArgumentParser {
  std::string                                  program_name_;
  std::vector<Option>                          options_;
  std::unordered_map<std::string, std::size_t> option_map_;

public:
  explicit ArgumentParser(std::string program_name);

  auto add_option(std::string long_name, std::string description, std::size_t arity = 0, std::string value_names = "")
      -> Option&;

  [[nodiscard]] auto parse(std::span<std::string const> args) const -> Result<Arguments>;
  [[nodiscard]] auto parse(int argc, char** argv) const -> Result<Arguments>;

  [[nodiscard]] std::string generate_help() const;
};

// Parser for the `--dya-*` management flags.
auto create_dya_parser() -> ArgumentParser;

} // namespace dynalias::cli
