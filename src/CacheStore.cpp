#include "dynalias/CacheStore.hpp"
#include "dynalias/Constants.hpp"
#include "dynalias/Template.hpp"
#include "dynalias/Util.hpp"

#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <fmt/std.h>

namespace dynalias {

namespace {

using nlohmann::json;

std::string const HISTORY_KEY(constant::CACHE_KEY_HISTORY);
std::string const LOCALS_KEY(constant::CACHE_KEY_LOCALS);
std::string const CRYPT_KEY(constant::CACHE_KEY_CRYPT);
std::string const TIMESTAMP_KEY(constant::CACHE_KEY_TIMESTAMP);
std::string const DATA_KEY(constant::CACHE_KEY_DATA);

bool is_internal(std::string const& key) {
  return !key.empty() && key.front() == '_';
}

std::int64_t timestamp_of(json const& entry) {
  auto it = entry.find(TIMESTAMP_KEY);
  return it != entry.end() && it->is_number() ? it->get<std::int64_t>() : 0;
}

} // namespace

CacheStore::CacheStore(std::filesystem::path path, bool enabled, crypto::KeyProvider key_provider)
    : path_(std::move(path)), enabled_(enabled), key_provider_(std::move(key_provider)) {}

auto CacheStore::key() -> Result<crypto::Key> {
  if (!key_) {
    auto derived = key_provider_();
    if (!derived) {
      return std::unexpected(derived.error());
    }
    key_ = *derived;
  }
  return *key_;
}

auto CacheStore::read_file(bool& plaintext) -> Result<json> {
  plaintext = false;

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return json::object();
  }

  std::ifstream in(path_);
  if (!in.is_open()) {
    return std::unexpected(fmt::format("Failed to load cache: cannot open {}", path_));
  }

  json raw = json::parse(in, nullptr, false);
  if (raw.is_discarded() || !raw.is_object()) {
    return std::unexpected("Failed to load cache: not a JSON object");
  }

  auto crypt = raw.find(CRYPT_KEY);
  if (crypt == raw.end()) {
    plaintext = true;
    return raw;
  }

  if (!crypt->is_string()) {
    return std::unexpected("Failed to decrypt cache: malformed payload");
  }
  auto k = key();
  if (!k) {
    return std::unexpected(fmt::format("Failed to decrypt cache: {}", k.error()));
  }
  auto text = crypto::decrypt(crypt->get<std::string>(), *k);
  if (!text) {
    return std::unexpected(fmt::format("Failed to decrypt cache: {}", text.error()));
  }
  json doc = json::parse(*text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::unexpected("Failed to decrypt cache: decrypted payload is not a JSON object");
  }
  return doc;
}

void CacheStore::load() {
  if (!enabled_) {
    return;
  }
  bool plaintext = false;
  auto disk      = read_file(plaintext);
  if (!disk) {
    fmt::print(stderr, "Warning: {}\n", disk.error());
    fmt::print(stderr, "  Cache may have been created on a different machine.\n");
    doc_ = json::object();
    return;
  }
  doc_             = std::move(*disk);
  needs_migration_ = plaintext && !doc_.empty();
}

void CacheStore::reload() {
  if (!enabled_) {
    return;
  }
  bool plaintext = false;
  auto disk      = read_file(plaintext);
  if (!disk) {
    fmt::print(stderr, "Warning: {}\n", disk.error());
    return;
  }
  // The file is the base: whatever a child added, changed or removed wins.
  doc_             = std::move(*disk);
  needs_migration_ = needs_migration_ || (plaintext && !doc_.empty());
}

void CacheStore::save() {
  if (!enabled_) {
    return;
  }
  auto k = key();
  if (!k) {
    fmt::print(stderr, "Warning: Failed to save cache: {}\n", k.error());
    return;
  }
  auto blob = crypto::encrypt(doc_.dump(-1, ' ', false, json::error_handler_t::replace), *k);
  if (!blob) {
    fmt::print(stderr, "Warning: Failed to save cache: {}\n", blob.error());
    return;
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::trunc);
  if (!out.is_open()) {
    fmt::print(stderr, "Warning: Failed to save cache: cannot write {}\n", path_);
    return;
  }
  out << json{{CRYPT_KEY, *blob}}.dump();
  if (!out) {
    fmt::print(stderr, "Warning: Failed to save cache: write error on {}\n", path_);
    return;
  }
  needs_migration_ = false;
}

auto CacheStore::get(std::string const& name, std::int64_t ttl) const -> std::optional<Rows> {
  if (!enabled_) {
    return std::nullopt;
  }
  auto entry = doc_.find(name);
  if (entry == doc_.end() || !entry->is_object()) {
    return std::nullopt;
  }
  auto data = entry->find(DATA_KEY);
  if (data == entry->end() || !data->is_array()) {
    return std::nullopt;
  }
  if (unix_now() - timestamp_of(*entry) > ttl) {
    return std::nullopt;
  }
  return Rows(data->begin(), data->end());
}

void CacheStore::set(std::string const& name, Rows const& rows) {
  set_at(name, rows, unix_now());
}

void CacheStore::set_at(std::string const& name, Rows const& rows, std::int64_t timestamp) {
  if (!enabled_) {
    return;
  }
  doc_[name] = json{
      {TIMESTAMP_KEY, timestamp },
      {DATA_KEY,      json(rows)}
  };
}

void CacheStore::add_history(std::string const& command, std::size_t limit) {
  if (!enabled_) {
    return;
  }
  limit = std::min(limit, constant::MAX_HISTORY_SIZE);

  auto& history = doc_[HISTORY_KEY];
  if (!history.is_array()) {
    history = json::array();
  }
  history.push_back(command);
  if (history.size() > limit) {
    auto excess = static_cast<std::ptrdiff_t>(history.size() - limit);
    history.erase(history.begin(), history.begin() + excess);
  }
}

auto CacheStore::history() const -> std::vector<std::string> {
  std::vector<std::string> out;
  auto                     it = doc_.find(HISTORY_KEY);
  if (!enabled_ || it == doc_.end() || !it->is_array()) {
    return out;
  }
  for (auto const& entry : *it) {
    if (entry.is_string()) {
      out.push_back(entry.get<std::string>());
    }
  }
  return out;
}

auto CacheStore::clear_history() -> bool {
  if (!enabled_ || doc_.erase(HISTORY_KEY) == 0) {
    return false;
  }
  save();
  return true;
}

void CacheStore::set_local(std::string const& key, std::string const& value) {
  if (!enabled_) {
    return;
  }
  auto& locals = doc_[LOCALS_KEY];
  if (!locals.is_object()) {
    locals = json::object();
  }
  locals[key] = value;
  save();
}

auto CacheStore::get_local(std::string const& key) const -> std::optional<std::string> {
  if (!enabled_) {
    return std::nullopt;
  }
  auto locals = doc_.find(LOCALS_KEY);
  if (locals == doc_.end() || !locals->is_object()) {
    return std::nullopt;
  }
  auto it = locals->find(key);
  if (it == locals->end()) {
    return std::nullopt;
  }
  return display_value(*it);
}

auto CacheStore::locals() const -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  auto                               it = doc_.find(LOCALS_KEY);
  if (!enabled_ || it == doc_.end() || !it->is_object()) {
    return out;
  }
  for (auto const& [k, v] : it->items()) {
    out.emplace(k, display_value(v));
  }
  return out;
}

auto CacheStore::clear_locals() -> bool {
  if (!enabled_ || doc_.erase(LOCALS_KEY) == 0) {
    return false;
  }
  save();
  return true;
}

auto CacheStore::clear_sources() -> std::size_t {
  if (!enabled_) {
    return 0;
  }
  std::vector<std::string> doomed;
  for (auto const& [k, v] : doc_.items()) {
    if (!is_internal(k)) {
      doomed.push_back(k);
    }
  }
  for (auto const& k : doomed) {
    doc_.erase(k);
  }
  save();
  return doomed.size();
}

auto CacheStore::delete_all() -> bool {
  doc_             = json::object();
  needs_migration_ = false;
  std::error_code ec;
  bool            removed = std::filesystem::remove(path_, ec);
  if (ec) {
    fmt::print(stderr, "Warning: Failed to delete cache {}: {}\n", path_, ec.message());
  }
  return removed;
}

auto CacheStore::purge_expired(std::unordered_map<std::string, std::int64_t> const& ttl_map) -> std::size_t {
  if (!enabled_) {
    return 0;
  }
  auto                     now = unix_now();
  std::vector<std::string> doomed;
  for (auto const& [k, v] : doc_.items()) {
    if (is_internal(k) || !v.is_object()) {
      continue;
    }
    auto it  = ttl_map.find(k);
    auto ttl = it == ttl_map.end() ? constant::DEFAULT_CACHE_TTL : it->second;
    if (now - timestamp_of(v) > ttl) {
      doomed.push_back(k);
    }
  }
  for (auto const& k : doomed) {
    doc_.erase(k);
  }
  if (!doomed.empty()) {
    save();
  }
  return doomed.size();
}

bool CacheStore::enabled() const noexcept {
  return enabled_;
}

bool CacheStore::needs_migration() const noexcept {
  return needs_migration_;
}

std::filesystem::path const& CacheStore::path() const noexcept {
  return path_;
}

nlohmann::json const& CacheStore::document() const noexcept {
  return doc_;
}

} // namespace dynalias
