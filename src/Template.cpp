#include "dynalias/Template.hpp"
#include "dynalias/Constants.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fmt/core.h>

namespace dynalias {

namespace {

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

size_t scan_word(std::string_view text, size_t pos) {
  while (pos < text.size() && is_word_char(text[pos])) {
    ++pos;
  }
  return pos;
}

// Try to read an app variable starting at `pos` (which points at "$${").
// On success returns the reference and stores the position one past '}'.
std::optional<AppVarRef> scan_app_var(std::string_view text, size_t pos, size_t& end) {
  if (text.substr(pos, 3) != "$${") {
    return std::nullopt;
  }
  size_t i = pos + 3;

  size_t source_end = scan_word(text, i);
  if (source_end == i) {
    return std::nullopt;
  }
  AppVarRef ref;
  ref.source_ = std::string(text.substr(i, source_end - i));
  i           = source_end;

  if (i < text.size() && text[i] == '[') {
    size_t digits_begin = i + 1;
    size_t digits_end   = digits_begin;
    while (digits_end < text.size() && std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
      ++digits_end;
    }
    if (digits_end == digits_begin || digits_end >= text.size() || text[digits_end] != ']') {
      return std::nullopt;
    }
    size_t index = 0;
    auto [ptr, ec] = std::from_chars(text.data() + digits_begin, text.data() + digits_end, index);
    if (ec != std::errc{}) {
      return std::nullopt;
    }
    ref.index_ = index;
    i          = digits_end + 1;
  }

  if (i >= text.size() || text[i] != '.') {
    return std::nullopt;
  }
  ++i;
  size_t key_end = scan_word(text, i);
  if (key_end == i || key_end >= text.size() || text[key_end] != '}') {
    return std::nullopt;
  }
  ref.key_ = std::string(text.substr(i, key_end - i));
  end      = key_end + 1;
  return ref;
}

std::optional<std::string> scan_user_var(std::string_view text, size_t pos, size_t& end) {
  if (text.substr(pos, 2) != "${") {
    return std::nullopt;
  }
  size_t name_end = scan_word(text, pos + 2);
  if (name_end == pos + 2 || name_end >= text.size() || text[name_end] != '}') {
    return std::nullopt;
  }
  end = name_end + 1;
  return std::string(text.substr(pos + 2, name_end - pos - 2));
}

std::optional<std::string> field_of(Row const& row, std::string const& key) {
  if (!row.is_object()) {
    return std::nullopt;
  }
  auto it = row.find(key);
  if (it == row.end()) {
    return std::nullopt;
  }
  return display_value(*it);
}

std::string placeholder_label(AppVarRef const& ref) {
  return ref.index_ ? fmt::format("{}[{}].{}", ref.source_, *ref.index_, ref.key_)
                    : fmt::format("{}.{}", ref.source_, ref.key_);
}

std::optional<std::string> resolve_one_ref(
    AppVarRef const&    ref,
    SourceLookup const& source_lookup,
    Variables const&    vars,
    LocalsLookup const& locals_lookup,
    bool                verbose
) {
  if (ref.source_ == constant::LOCALS_SOURCE && locals_lookup) {
    auto value = locals_lookup(ref.key_);
    if (value && verbose) {
      fmt::print("[VERBOSE] Resolved $${{locals.{}}} = '{}'\n", ref.key_, *value);
    }
    return value;
  }

  if (!ref.index_) {
    auto bound = vars.find(ref.source_);
    if (bound != vars.end()) {
      if (auto const* row = std::get_if<Row>(&bound->second)) {
        auto value = field_of(*row, ref.key_);
        if (value && verbose) {
          fmt::print("[VERBOSE] Resolved $${{{}}} = '{}' (from context)\n", placeholder_label(ref), *value);
        }
        return value;
      }
    }
  }

  Rows const& rows = source_lookup(ref.source_);
  if (rows.empty()) {
    return std::nullopt;
  }
  size_t index = ref.index_.value_or(0);
  if (index >= rows.size()) {
    fmt::print(stderr, "Warning: Index {} out of bounds for '{}' (size: {})\n", index, ref.source_, rows.size());
    return std::nullopt;
  }
  auto value = field_of(rows[index], ref.key_);
  if (value && verbose) {
    fmt::print("[VERBOSE] Resolved $${{{}}} = '{}'\n", placeholder_label(ref), *value);
  }
  return value;
}

} // namespace

auto parse_app_var(std::string_view token) -> std::optional<AppVarRef> {
  size_t end = 0;
  auto   ref = scan_app_var(token, 0, end);
  if (!ref || end != token.size()) {
    return std::nullopt;
  }
  return ref;
}

auto parse_user_var(std::string_view token) -> std::optional<std::string> {
  size_t end  = 0;
  auto   name = scan_user_var(token, 0, end);
  if (!name || end != token.size()) {
    return std::nullopt;
  }
  return name;
}

auto extract_app_vars(std::string_view text) -> std::vector<AppVarRef> {
  std::vector<AppVarRef> refs;
  size_t                 pos = 0;
  while ((pos = text.find("$${", pos)) != std::string_view::npos) {
    size_t end = 0;
    if (auto ref = scan_app_var(text, pos, end)) {
      if (std::ranges::find(refs, *ref) == refs.end()) {
        refs.push_back(std::move(*ref));
      }
      pos = end;
    } else {
      ++pos;
    }
  }
  return refs;
}

auto resolve_app_vars(
    std::string_view    text,
    SourceLookup const& source_lookup,
    Variables const&    vars,
    LocalsLookup const& locals_lookup,
    bool                verbose
) -> std::string {
  std::string out;
  out.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    size_t found = text.find("$${", pos);
    if (found == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, found - pos));

    size_t end = 0;
    auto   ref = scan_app_var(text, found, end);
    if (!ref) {
      out.push_back(text[found]);
      pos = found + 1;
      continue;
    }

    if (auto value = resolve_one_ref(*ref, source_lookup, vars, locals_lookup, verbose)) {
      out.append(*value);
    } else {
      out.append(text.substr(found, end - found));
    }
    pos = end;
  }
  return out;
}

auto resolve_user_vars(std::string_view text, Variables const& vars) -> std::string {
  std::string out;
  out.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    size_t found = text.find("${", pos);
    if (found == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, found - pos));

    size_t end  = 0;
    auto   name = scan_user_var(text, found, end);
    if (!name) {
      out.push_back(text[found]);
      pos = found + 1;
      continue;
    }

    auto bound = vars.find(*name);
    if (bound != vars.end() && std::holds_alternative<std::string>(bound->second)) {
      out.append(std::get<std::string>(bound->second));
    } else {
      out.append(text.substr(found, end - found));
    }
    pos = end;
  }
  return out;
}

auto display_value(nlohmann::json const& value) -> std::string {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace dynalias
