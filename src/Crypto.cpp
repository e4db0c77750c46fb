#include "dynalias/Crypto.hpp"
#include "dynalias/Util.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <sstream>
#include <fmt/core.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#if defined(__APPLE__)
#include "dynalias/Process.hpp"
#elif defined(_WIN32)
#include <windows.h>
#endif

namespace dynalias::crypto {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string openssl_error(std::string_view what) {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return std::string(what);
  }
  std::array<char, 256> buf{};
  ERR_error_string_n(code, buf.data(), buf.size());
  return fmt::format("{}: {}", what, buf.data());
}

#if defined(__linux__)

auto linux_machine_id() -> Result<std::string> {
  for (char const* path : {"/etc/machine-id", "/var/lib/dbus/machine-id"}) {
    std::ifstream in(path);
    if (!in.is_open()) {
      continue;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto id = trim(ss.str());
    if (!id.empty()) {
      return id;
    }
  }
  return std::unexpected("Failed to get Linux machine-id: file not found or empty");
}

#elif defined(__APPLE__)

auto macos_platform_uuid() -> Result<std::string> {
  ShellRunner runner;
  auto        out = runner.run("ioreg -rd1 -c IOPlatformExpertDevice", std::chrono::seconds(10), OutputMode::Capture);
  if (!out) {
    return std::unexpected(fmt::format("Failed to get macOS IOPlatformUUID: {}", out.error().message()));
  }
  std::istringstream lines(out->stdout_);
  std::string        line;
  while (std::getline(lines, line)) {
    if (line.find("IOPlatformUUID") == std::string::npos) {
      continue;
    }
    // "IOPlatformUUID" = "XXXXXXXX-XXXX-..."
    auto last  = line.rfind('"');
    auto first = last == std::string::npos || last == 0 ? std::string::npos : line.rfind('"', last - 1);
    if (first != std::string::npos) {
      return line.substr(first + 1, last - first - 1);
    }
  }
  return std::unexpected("IOPlatformUUID not found in ioreg output");
}

#elif defined(_WIN32)

auto windows_machine_guid() -> Result<std::string> {
  std::array<char, 128> value{};
  DWORD                 size = static_cast<DWORD>(value.size());
  LSTATUS               rc   = RegGetValueA(
      HKEY_LOCAL_MACHINE,
      "SOFTWARE\\Microsoft\\Cryptography",
      "MachineGuid",
      RRF_RT_REG_SZ | RRF_SUBKEY_WOW6464KEY,
      nullptr,
      value.data(),
      &size
  );
  if (rc != ERROR_SUCCESS) {
    return std::unexpected(fmt::format("Failed to get Windows MachineGuid: error {}", rc));
  }
  return std::string(value.data());
}

#endif

} // namespace

auto machine_identity() -> Result<std::string> {
#if defined(__linux__)
  return linux_machine_id();
#elif defined(__APPLE__)
  return macos_platform_uuid();
#elif defined(_WIN32)
  return windows_machine_guid();
#else
  return std::unexpected("PlatformUnsupported: no machine identity on this platform");
#endif
}

auto derive_key(std::string_view identity) -> Result<Key> {
  Key key{};
  int ok = PKCS5_PBKDF2_HMAC(
      identity.data(),
      static_cast<int>(identity.size()),
      reinterpret_cast<unsigned char const*>(KEY_DERIVATION_SALT.data()),
      static_cast<int>(KEY_DERIVATION_SALT.size()),
      KEY_DERIVATION_ITERATIONS,
      EVP_sha256(),
      static_cast<int>(key.size()),
      key.data()
  );
  if (ok != 1) {
    return std::unexpected(openssl_error("PBKDF2 failed"));
  }
  return key;
}

auto machine_key() -> Result<Key> {
  auto id = machine_identity();
  if (!id) {
    return std::unexpected(id.error());
  }
  return derive_key(*id);
}

auto encrypt(std::string_view plaintext, Key const& key) -> Result<std::string> {
  std::vector<unsigned char> out(IV_SIZE + TAG_SIZE + plaintext.size());
  unsigned char*             iv         = out.data();
  unsigned char*             tag        = out.data() + IV_SIZE;
  unsigned char*             ciphertext = out.data() + IV_SIZE + TAG_SIZE;

  if (RAND_bytes(iv, static_cast<int>(IV_SIZE)) != 1) {
    return std::unexpected(openssl_error("RAND_bytes failed"));
  }

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return std::unexpected(openssl_error("EVP_CIPHER_CTX_new failed"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
    return std::unexpected(openssl_error("AES-256-GCM init failed"));
  }

  int len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(
          ctx.get(),
          ciphertext,
          &len,
          reinterpret_cast<unsigned char const*>(plaintext.data()),
          static_cast<int>(plaintext.size())
      ) != 1) {
    return std::unexpected(openssl_error("AES-256-GCM encrypt failed"));
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &final_len) != 1) {
    return std::unexpected(openssl_error("AES-256-GCM finalize failed"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
    return std::unexpected(openssl_error("AES-256-GCM tag failed"));
  }

  out.resize(IV_SIZE + TAG_SIZE + static_cast<size_t>(len + final_len));
  return base64_encode(out);
}

auto decrypt(std::string_view blob, Key const& key) -> Result<std::string> {
  auto raw = base64_decode(blob);
  if (!raw) {
    return std::unexpected(fmt::format("Failed to decrypt cache data: {}", raw.error()));
  }
  if (raw->size() < IV_SIZE + TAG_SIZE) {
    return std::unexpected("Failed to decrypt cache data: payload too short");
  }

  unsigned char const* iv         = raw->data();
  unsigned char const* tag        = raw->data() + IV_SIZE;
  unsigned char const* ciphertext = raw->data() + IV_SIZE + TAG_SIZE;
  size_t               length     = raw->size() - IV_SIZE - TAG_SIZE;

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return std::unexpected(openssl_error("EVP_CIPHER_CTX_new failed"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_SIZE), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), iv) != 1) {
    return std::unexpected(openssl_error("AES-256-GCM init failed"));
  }

  std::string plaintext(length, '\0');
  int         len = 0;
  if (length > 0 &&
      EVP_DecryptUpdate(
          ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len, ciphertext, static_cast<int>(length)
      ) != 1) {
    return std::unexpected(openssl_error("Failed to decrypt cache data"));
  }
  // OpenSSL takes a non-const pointer for the expected tag
  std::array<unsigned char, TAG_SIZE> expected_tag{};
  std::copy(tag, tag + TAG_SIZE, expected_tag.begin());
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), expected_tag.data()) != 1) {
    return std::unexpected(openssl_error("Failed to decrypt cache data"));
  }
  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + len, &final_len) != 1) {
    return std::unexpected("Failed to decrypt cache data: authentication failed (wrong key or corrupted data)");
  }
  plaintext.resize(static_cast<size_t>(len + final_len));
  return plaintext;
}

auto base64_encode(std::span<unsigned char const> bytes) -> std::string {
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  int         n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

auto base64_decode(std::string_view text) -> Result<std::vector<unsigned char>> {
  if (text.size() % 4 != 0) {
    return std::unexpected("invalid base64 length");
  }
  std::vector<unsigned char> out(3 * text.size() / 4);
  int                        n = EVP_DecodeBlock(
      out.data(), reinterpret_cast<unsigned char const*>(text.data()), static_cast<int>(text.size())
  );
  if (n < 0) {
    return std::unexpected("invalid base64 data");
  }
  size_t padding = 0;
  if (!text.empty() && text.back() == '=') {
    ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

} // namespace dynalias::crypto
