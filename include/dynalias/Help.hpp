#pragma once

#include "dynalias/Cli.hpp"
#include "dynalias/Model.hpp"

#include <string>

namespace dynalias {

// Helper text of every chain element that has one, separated by blank lines.
auto format_custom_help(Chain const& chain) -> std::string;
// Description / Usage / Args / Options layout for the last matched command.
auto format_auto_help(Chain const& chain) -> std::string;
// Picks the layout from the chain root's helper type and adds the banner.
auto format_command_help(Chain const& chain) -> std::string;

auto format_global_help(Model const& model) -> std::string;
auto format_app_help(cli::ArgumentParser const& parser) -> std::string;

} // namespace dynalias
