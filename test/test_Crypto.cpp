#include "dynalias/Crypto.hpp"
#include "test_utils.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace dynalias;
using dynalias::test::fixed_key;

namespace {

std::string round_trip(std::string const& text, crypto::Key const& key) {
  auto blob = crypto::encrypt(text, key);
  EXPECT_TRUE(blob.has_value()) << blob.error();
  auto plain = crypto::decrypt(*blob, key);
  EXPECT_TRUE(plain.has_value()) << plain.error();
  return plain.value_or("");
}

} // namespace

TEST(Crypto, RoundTripsJsonDocuments) {
  auto key = fixed_key(0x11);

  std::vector<nlohmann::json> docs{
      nlohmann::json::object(),
      {{"_history", {"pg prod", "ssh dev", "deploy --now"}}},
      {{"servers", {{"timestamp", 1700000000}, {"data", {{{"name", "a"}, {"nested", {{"x", {1, 2, 3}}}}}}}}}},
      {{"_locals", {{"greeting", "olá, 世界"}, {"emoji", "🚀"}}}},
  };
  for (auto const& doc : docs) {
    auto text = doc.dump();
    EXPECT_EQ(round_trip(text, key), text);
    EXPECT_EQ(nlohmann::json::parse(round_trip(text, key)), doc);
  }
}

TEST(Crypto, EmptyPlaintext) {
  EXPECT_EQ(round_trip("", fixed_key(0x01)), "");
}

TEST(Crypto, BlobLayout) {
  auto blob = crypto::encrypt("hello", fixed_key(0x22));
  ASSERT_TRUE(blob.has_value()) << blob.error();
  auto raw = crypto::base64_decode(*blob);
  ASSERT_TRUE(raw.has_value()) << raw.error();
  EXPECT_EQ(raw->size(), crypto::IV_SIZE + crypto::TAG_SIZE + 5);
}

TEST(Crypto, FreshIvPerEncryption) {
  auto key = fixed_key(0x33);
  auto a   = crypto::encrypt("same text", key);
  auto b   = crypto::encrypt("same text", key);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(*a, *b);
}

TEST(Crypto, WrongKeyFailsAuthentication) {
  auto blob = crypto::encrypt("secret", fixed_key(0x44));
  ASSERT_TRUE(blob.has_value());
  auto plain = crypto::decrypt(*blob, fixed_key(0x45));
  ASSERT_FALSE(plain.has_value());
  EXPECT_NE(plain.error().find("authentication failed"), std::string::npos);
}

TEST(Crypto, TamperedBlobIsRejected) {
  auto key  = fixed_key(0x55);
  auto blob = crypto::encrypt("{\"a\":1}", key);
  ASSERT_TRUE(blob.has_value());
  std::string tampered = *blob;
  tampered[20]         = tampered[20] == 'A' ? 'B' : 'A';
  EXPECT_FALSE(crypto::decrypt(tampered, key).has_value());
}

TEST(Crypto, GarbageIsRejected) {
  auto key = fixed_key(0x66);
  EXPECT_FALSE(crypto::decrypt("not base64!", key).has_value());
  EXPECT_FALSE(crypto::decrypt("QUJD", key).has_value()); // decodes to 3 bytes, too short
}

TEST(Crypto, Base64) {
  std::string const          text = "any carnal pleas";
  std::vector<unsigned char> bytes(text.begin(), text.end());
  EXPECT_EQ(crypto::base64_encode(bytes), "YW55IGNhcm5hbCBwbGVhcw==");

  auto decoded = crypto::base64_decode("YW55IGNhcm5hbCBwbGVhcw==");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(std::string(decoded->begin(), decoded->end()), text);

  EXPECT_FALSE(crypto::base64_decode("abc").has_value());
}

TEST(Crypto, DeriveKeyIsDeterministicPerIdentity) {
  auto a  = crypto::derive_key("machine-a");
  auto a2 = crypto::derive_key("machine-a");
  auto b  = crypto::derive_key("machine-b");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(a2.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*a, *a2);
  EXPECT_NE(*a, *b);
}

TEST(Crypto, MachineKeyMatchesIdentity) {
  auto identity = crypto::machine_identity();
  if (!identity) {
    GTEST_SKIP() << identity.error();
  }
  EXPECT_FALSE(identity->empty());
  auto key = crypto::machine_key();
  ASSERT_TRUE(key.has_value()) << key.error();
  EXPECT_EQ(*key, *crypto::derive_key(*identity));
}
