#pragma once

#include "dynalias/Result.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dynalias {

std::string trim(std::string_view s);

// Split a line into words on unquoted whitespace. Single and double quotes
// group words and are stripped; a backslash escapes the next character.
// Unbalanced quotes are an error.
Result<std::vector<std::string>> tokenize(std::string_view line);

// Split a template on whitespace, dropping empty pieces.
std::vector<std::string> split_words(std::string_view text);

// Quote a word for /bin/sh. Words made only of safe characters are returned
// unchanged, everything else is wrapped in single quotes.
std::string shell_quote(std::string_view word);
std::string join_quoted(std::span<std::string const> words);

// "~" and "~/..." expand to $HOME; other paths are returned unchanged.
std::filesystem::path expand_home(std::string_view path);

// First candidate that exists, else the fallback. All entries go through
// expand_home().
std::filesystem::path first_existing(std::span<std::string_view const> candidates, std::string_view fallback);

// Cut text to at most `limit` characters, appending "..." when cut.
std::string preview(std::string_view text, size_t limit);

std::int64_t unix_now();

} // namespace dynalias
