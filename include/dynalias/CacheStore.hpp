#pragma once

#include "dynalias/Crypto.hpp"
#include "dynalias/Model.hpp"
#include "dynalias/Result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace dynalias {

// Persistent key/value store for resolved source rows, history and locals.
//
// On disk the document is {"_crypt": base64(iv || tag || ciphertext)}, the
// ciphertext being the JSON of the in-memory document encrypted with a key
// derived from the machine identity. A legacy plaintext document is still
// read and gets encrypted by the next save().
//
// Logical layout:
//   <source>  -> {"timestamp": <unix seconds>, "data": [ {...}, ... ]}
//   _history  -> ["previous invocation", ...]
//   _locals   -> {"key": "value", ...}
//
// The store never fails its caller: unreadable or foreign files degrade to an
// empty document with a warning. Saving happens once per top-level command;
// spawned children may write the same file, so callers save() before a spawn
// and reload() then save() after it.
class CacheStore {
  std::filesystem::path      path_;
  bool                       enabled_;
  crypto::KeyProvider        key_provider_;
  std::optional<crypto::Key> key_;
  nlohmann::json             doc_             = nlohmann::json::object();
  bool                       needs_migration_ = false;

public:
  explicit CacheStore(
      std::filesystem::path path,
      bool                  enabled      = true,
      crypto::KeyProvider   key_provider = crypto::machine_key
  );

  // Replace the in-memory document with the file contents.
  void load();
  // Take the file contents as the new in-memory document, so additions and
  // removals made by another process are both picked up. A failed read keeps
  // memory as is.
  void reload();
  void save();

  [[nodiscard]] auto get(std::string const& name, std::int64_t ttl) const -> std::optional<Rows>;
  void               set(std::string const& name, Rows const& rows);
  void               set_at(std::string const& name, Rows const& rows, std::int64_t timestamp);

  void               add_history(std::string const& command, std::size_t limit);
  [[nodiscard]] auto history() const -> std::vector<std::string>;
  auto               clear_history() -> bool;

  void               set_local(std::string const& key, std::string const& value);
  [[nodiscard]] auto get_local(std::string const& key) const -> std::optional<std::string>;
  [[nodiscard]] auto locals() const -> std::map<std::string, std::string>;
  auto               clear_locals() -> bool;

  // Remove every entry whose key does not start with '_'.
  auto clear_sources() -> std::size_t;
  // Remove the file and reset memory. True when a file was removed.
  auto delete_all() -> bool;
  // Remove source entries older than their TTL (300 s when not listed).
  auto purge_expired(std::unordered_map<std::string, std::int64_t> const& ttl_map) -> std::size_t;

  [[nodiscard]] bool                         enabled() const noexcept;
  [[nodiscard]] bool                         needs_migration() const noexcept;
  [[nodiscard]] std::filesystem::path const& path() const noexcept;
  [[nodiscard]] nlohmann::json const&        document() const noexcept;

private:
  auto key() -> Result<crypto::Key>;
  auto read_file(bool& plaintext) -> Result<nlohmann::json>;
};

} // namespace dynalias
