#include "dynalias/Util.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fmt/core.h>

namespace dynalias {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_safe_shell_char(char c) {
  if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
    return true;
  }
  switch (c) {
  case '_':
  case '@':
  case '%':
  case '+':
  case '=':
  case ':':
  case ',':
  case '.':
  case '/':
  case '-':
    return true;
  default:
    return false;
  }
}

} // namespace

std::string trim(std::string_view sv) {
  size_t begin = 0;
  size_t end   = sv.size();
  while (begin < end && is_space(sv[begin])) {
    ++begin;
  }
  while (end > begin && is_space(sv[end - 1])) {
    --end;
  }
  return std::string(sv.substr(begin, end - begin));
}

Result<std::vector<std::string>> tokenize(std::string_view line) {
  std::vector<std::string> words;
  std::string              current;
  bool                     in_single = false;
  bool                     in_double = false;
  bool                     in_word   = false;

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '\\' && !in_single) {
      if (i + 1 < line.size()) {
        current.push_back(line[i + 1]);
        ++i;
      }
      in_word = true;
      continue;
    }
    if (c == '\'' && !in_double) {
      in_single = !in_single;
      in_word   = true;
      continue;
    }
    if (c == '"' && !in_single) {
      in_double = !in_double;
      in_word   = true;
      continue;
    }
    if (is_space(c) && !in_single && !in_double) {
      if (in_word) {
        words.push_back(std::move(current));
        current.clear();
        in_word = false;
      }
      continue;
    }
    current.push_back(c);
    in_word = true;
  }

  if (in_single || in_double) {
    return std::unexpected("Invalid quotes");
  }
  if (in_word) {
    words.push_back(std::move(current));
  }
  return words;
}

std::vector<std::string> split_words(std::string_view text) {
  std::vector<std::string> words;
  size_t                   pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && is_space(text[pos])) {
      ++pos;
    }
    size_t start = pos;
    while (pos < text.size() && !is_space(text[pos])) {
      ++pos;
    }
    if (pos > start) {
      words.emplace_back(text.substr(start, pos - start));
    }
  }
  return words;
}

std::string shell_quote(std::string_view word) {
  if (word.empty()) {
    return "''";
  }
  bool safe = true;
  for (char c : word) {
    if (!is_safe_shell_char(c)) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return std::string(word);
  }

  std::string out;
  out.reserve(word.size() + 2);
  out.push_back('\'');
  for (char c : word) {
    if (c == '\'') {
      out += "'\"'\"'"; // close ', add "'" , reopen '
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string join_quoted(std::span<std::string const> words) {
  std::string out;
  for (size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += shell_quote(words[i]);
  }
  return out;
}

std::filesystem::path expand_home(std::string_view path) {
  if (path.empty() || path.front() != '~') {
    return std::filesystem::path(path);
  }
  if (path.size() > 1 && path[1] != '/') {
    return std::filesystem::path(path);
  }
  char const* home = std::getenv("HOME");
  if (home == nullptr) {
    return std::filesystem::path(path);
  }
  return std::filesystem::path(fmt::format("{}{}", home, path.substr(1)));
}

std::filesystem::path first_existing(std::span<std::string_view const> candidates, std::string_view fallback) {
  for (auto candidate : candidates) {
    auto            expanded = expand_home(candidate);
    std::error_code ec;
    if (std::filesystem::exists(expanded, ec)) {
      return expanded;
    }
  }
  return expand_home(fallback);
}

std::string preview(std::string_view text, size_t limit) {
  if (text.size() <= limit) {
    return std::string(text);
  }
  return fmt::format("{}...", text.substr(0, limit));
}

std::int64_t unix_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

} // namespace dynalias
