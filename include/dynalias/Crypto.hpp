#pragma once

#include "dynalias/Result.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dynalias::crypto {

inline constexpr std::string_view KEY_DERIVATION_SALT       = "dynamic-alias-cache-encryption-v1";
inline constexpr int              KEY_DERIVATION_ITERATIONS = 100000;
inline constexpr std::size_t      KEY_SIZE                  = 32;
inline constexpr std::size_t      IV_SIZE                   = 12;
inline constexpr std::size_t      TAG_SIZE                  = 16;

using Key         = std::array<unsigned char, KEY_SIZE>;
using KeyProvider = std::function<Result<Key>()>;

// Stable per-host identifier: /etc/machine-id on Linux, IOPlatformUUID on
// macOS, the registry MachineGuid on Windows. Fails with "PlatformUnsupported"
// elsewhere.
auto machine_identity() -> Result<std::string>;

// PBKDF2-HMAC-SHA256 over the identity with the fixed salt.
auto derive_key(std::string_view identity) -> Result<Key>;

// derive_key(machine_identity()); the default key provider of the cache.
auto machine_key() -> Result<Key>;

// AES-256-GCM. The blob is base64(iv[12] || tag[16] || ciphertext).
auto encrypt(std::string_view plaintext, Key const& key) -> Result<std::string>;
auto decrypt(std::string_view blob, Key const& key) -> Result<std::string>;

auto base64_encode(std::span<unsigned char const> bytes) -> std::string;
auto base64_decode(std::string_view text) -> Result<std::vector<unsigned char>>;

} // namespace dynalias::crypto
