#include <catch2/catch.hpp>

#include "crypto/crypto.hpp"
#include "test_support.hpp"

#include <filesystem>

using namespace relaychat;
using namespace relaychat::crypto;
using relaychat::testing::shared_server_key;
using relaychat::testing::TempDir;

namespace {

void give_key(SessionCipher& c){
  c.set_key(random_bytes(kSessionKeyBytes));
}

} // namespace

TEST_CASE("base64 matches RFC 4648 vectors", "[crypto][base64]"){
  CHECK(base64_encode(std::string("")) == "");
  CHECK(base64_encode(std::string("f")) == "Zg==");
  CHECK(base64_encode(std::string("fo")) == "Zm8=");
  CHECK(base64_encode(std::string("foo")) == "Zm9v");
  CHECK(base64_encode(std::string("foobar")) == "Zm9vYmFy");

  auto d = base64_decode("Zm9vYg==");
  REQUIRE(d.has_value());
  CHECK(std::string(d->begin(), d->end()) == "foob");

  CHECK_FALSE(base64_decode("Zm9").has_value());
  CHECK_FALSE(base64_decode("!!!!").has_value());
}

TEST_CASE("base64 padding is only accepted at the end", "[crypto][base64]"){
  CHECK_FALSE(base64_decode("====").has_value());
  CHECK_FALSE(base64_decode("=AAA").has_value());
  CHECK_FALSE(base64_decode("A===").has_value());
  CHECK_FALSE(base64_decode("AA=A").has_value());
  CHECK_FALSE(base64_decode("Zg==Zm8=").has_value());

  auto one = base64_decode("Zg==");
  REQUIRE(one.has_value());
  CHECK(one->size() == 1);
  auto two = base64_decode("Zm8=");
  REQUIRE(two.has_value());
  CHECK(two->size() == 2);
}

TEST_CASE("session cipher round trip", "[crypto][aes]"){
  SessionCipher c;
  give_key(c);
  const std::string plain = R"({"type":"PRIVATE","text":"hello"})";
  CHECK(c.decrypt(c.encrypt(plain)) == plain);
  CHECK(c.decrypt(c.encrypt("")) == "");
  const std::string block(32, 'a');  // exact block multiple still gets a padding block
  CHECK(c.decrypt(c.encrypt(block)) == block);
}

TEST_CASE("each encryption uses a fresh IV", "[crypto][aes]"){
  SessionCipher c;
  give_key(c);
  const std::string a = c.encrypt("same text");
  const std::string b = c.encrypt("same text");
  CHECK(a != b);

  auto raw = base64_decode(a);
  REQUIRE(raw.has_value());
  CHECK(raw->size() == kIvBytes + 16);
}

TEST_CASE("cipher without a key refuses to work", "[crypto][aes]"){
  SessionCipher c;
  CHECK_FALSE(c.has_key());
  CHECK_THROWS_AS(c.encrypt("x"), NoSessionKey);
  CHECK_THROWS_AS(c.decrypt("AAAA"), NoSessionKey);

  c.set_key(random_bytes(kSessionKeyBytes));
  CHECK(c.has_key());
  c.clear();
  CHECK_THROWS_AS(c.encrypt("x"), NoSessionKey);
}

TEST_CASE("session keys must be 256 bits", "[crypto][aes]"){
  SessionCipher c;
  CHECK_THROWS_AS(c.set_key(random_bytes(16)), CryptoError);
  CHECK_THROWS_AS(c.set_key({}), CryptoError);
  CHECK_FALSE(c.has_key());
}

TEST_CASE("corrupt frames raise DecryptionFailure", "[crypto][aes]"){
  SessionCipher c;
  give_key(c);
  const std::string good = c.encrypt("payload that spans more than one block");

  CHECK_THROWS_AS(c.decrypt("not base64 at all!"), DecryptionFailure);
  CHECK_THROWS_AS(c.decrypt(base64_encode(std::string(16, 'x'))), DecryptionFailure);  // IV only

  auto raw = base64_decode(good);
  REQUIRE(raw.has_value());
  raw->pop_back();  // ciphertext no longer a block multiple
  CHECK_THROWS_AS(c.decrypt(base64_encode(*raw)), DecryptionFailure);
}

TEST_CASE("RSA-OAEP wraps a session key", "[crypto][rsa]"){
  const RsaKeyPair& kp = shared_server_key();
  RsaPublicKey pub = RsaPublicKey::from_pem_b64(kp.public_key_pem_b64());

  auto key = random_bytes(kSessionKeyBytes);
  auto wrapped = pub.encrypt_oaep(key);
  CHECK(wrapped.size() == 256);
  CHECK(kp.decrypt_oaep(wrapped) == key);

  // OAEP is randomized too
  CHECK(pub.encrypt_oaep(key) != wrapped);
}

TEST_CASE("RSA rejects garbage", "[crypto][rsa]"){
  CHECK_THROWS_AS(RsaPublicKey::from_pem_b64("bm90IGEga2V5"), CryptoError);
  CHECK_THROWS_AS(RsaPublicKey::from_pem_b64(""), CryptoError);

  std::vector<uint8_t> junk(256, 0x42);
  CHECK_THROWS_AS(shared_server_key().decrypt_oaep(junk), DecryptionFailure);
  CHECK_THROWS_AS(shared_server_key().decrypt_oaep({}), DecryptionFailure);
}

TEST_CASE("server key persists as PEM", "[crypto][rsa]"){
  TempDir dir;
  const std::string path = dir.file("keys/server_key.pem");
  REQUIRE(shared_server_key().save_pem_file(path));

  auto perms = std::filesystem::status(path).permissions();
  CHECK((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
  CHECK((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

  auto loaded = RsaKeyPair::load_pem_file(path);
  REQUIRE(loaded.has_value());
  CHECK(loaded->public_key_pem_b64() == shared_server_key().public_key_pem_b64());

  CHECK_FALSE(RsaKeyPair::load_pem_file(dir.file("missing.pem")).has_value());
}
