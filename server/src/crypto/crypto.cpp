#include "crypto/crypto.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

namespace relaychat {
namespace crypto {

void PkeyDeleter::operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }

namespace {

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* p) const { EVP_CIPHER_CTX_free(p); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct BioDeleter {
  void operator()(BIO* p) const { BIO_free(p); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

// OpenSSL keeps a per-thread error queue; drop it so failures don't pile up
[[noreturn]] void fail(const char* what){
  ERR_clear_error();
  throw CryptoError(what);
}

[[noreturn]] void fail_decrypt(const char* what){
  ERR_clear_error();
  throw DecryptionFailure(what);
}

bool set_oaep_sha256(EVP_PKEY_CTX* ctx){
  return EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_OAEP_PADDING) > 0 &&
         EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) > 0 &&
         EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) > 0;
}

std::string trim_ws(const std::string& s){
  std::string out;
  out.reserve(s.size());
  for (char c : s){
    if (c==' ' || c=='\n' || c=='\r' || c=='\t') continue;
    out.push_back(c);
  }
  return out;
}

} // namespace

// ---------- encoding / randomness ----------

std::string base64_encode(const std::vector<uint8_t>& data){
  if (data.empty()) return {};
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                          data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(n));
  return out;
}

std::string base64_encode(const std::string& data){
  return base64_encode(std::vector<uint8_t>(data.begin(), data.end()));
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text){
  const std::string in = trim_ws(text);
  if (in.empty()) return std::vector<uint8_t>{};
  if (in.size() % 4 != 0) return std::nullopt;
  // padding only in the last two positions, and nothing after it
  const std::size_t first_pad = in.find('=');
  if (first_pad != std::string::npos){
    if (first_pad < in.size() - 2) return std::nullopt;
    if (in.find_first_not_of('=', first_pad) != std::string::npos) return std::nullopt;
  }

  std::vector<uint8_t> out(3 * in.size() / 4);
  int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                          static_cast<int>(in.size()));
  if (n < 0) return std::nullopt;
  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t pad = 0;
  if (in[in.size()-1] == '=') ++pad;
  if (in[in.size()-2] == '=') ++pad;
  out.resize(static_cast<std::size_t>(n) - pad);
  return out;
}

std::vector<uint8_t> random_bytes(std::size_t n){
  std::vector<uint8_t> buf(n);
  if (n && RAND_bytes(buf.data(), static_cast<int>(n)) != 1) fail("RAND_bytes failed");
  return buf;
}

void wipe(std::vector<uint8_t>& secret){
  if (!secret.empty()) OPENSSL_cleanse(secret.data(), secret.size());
  secret.clear();
}

// ---------- RSA ----------

RsaKeyPair RsaKeyPair::generate(int bits){
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!ctx) fail("EVP_PKEY_CTX_new_id failed");
  EVP_PKEY* k = nullptr;
  if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0 ||
      EVP_PKEY_keygen(ctx.get(), &k) <= 0 || !k){
    fail("RSA keygen failed");
  }
  return RsaKeyPair(PkeyPtr(k));
}

std::optional<RsaKeyPair> RsaKeyPair::load_pem_file(const std::string& path){
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return std::nullopt;
  EVP_PKEY* k = PEM_read_PrivateKey(f, nullptr, nullptr, nullptr);
  std::fclose(f);
  if (!k){ ERR_clear_error(); return std::nullopt; }
  PkeyPtr key(k);
  if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) return std::nullopt;
  return RsaKeyPair(std::move(key));
}

bool RsaKeyPair::save_pem_file(const std::string& path) const {
  std::filesystem::path fp(path);
  std::error_code ec;
  if (fp.has_parent_path()) std::filesystem::create_directories(fp.parent_path(), ec);

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) return false;
  const bool ok = PEM_write_PrivateKey(f, key_.get(), nullptr, nullptr, 0, nullptr, nullptr) == 1;
  std::fclose(f);
  if (!ok){ ERR_clear_error(); return false; }
  std::filesystem::permissions(fp,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace,
                               ec);
  return true;
}

std::string RsaKeyPair::public_key_pem_b64() const {
  BioPtr bio(BIO_new(BIO_s_mem()));
  if (!bio) fail("BIO_new failed");
  if (PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) fail("PEM_write_bio_PUBKEY failed");
  char* data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  if (len <= 0 || !data) fail("empty public key PEM");
  return base64_encode(std::string(data, static_cast<std::size_t>(len)));
}

std::vector<uint8_t> RsaKeyPair::decrypt_oaep(const std::vector<uint8_t>& ciphertext) const {
  if (ciphertext.empty()) throw DecryptionFailure("empty RSA ciphertext");
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key_.get(), nullptr));
  if (!ctx) fail_decrypt("EVP_PKEY_CTX_new failed");
  if (EVP_PKEY_decrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get()))
    fail_decrypt("RSA-OAEP init failed");

  std::size_t outlen = 0;
  if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outlen, ciphertext.data(), ciphertext.size()) <= 0)
    fail_decrypt("RSA-OAEP decrypt failed");
  std::vector<uint8_t> out(outlen);
  if (EVP_PKEY_decrypt(ctx.get(), out.data(), &outlen, ciphertext.data(), ciphertext.size()) <= 0)
    fail_decrypt("RSA-OAEP decrypt failed");
  out.resize(outlen);
  return out;
}

RsaPublicKey RsaPublicKey::from_pem_b64(const std::string& pem_b64){
  auto pem = base64_decode(pem_b64);
  if (!pem || pem->empty()) fail("public key is not base64");
  BioPtr bio(BIO_new_mem_buf(pem->data(), static_cast<int>(pem->size())));
  if (!bio) fail("BIO_new_mem_buf failed");
  EVP_PKEY* k = PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr);
  if (!k) fail("public key PEM is invalid");
  PkeyPtr key(k);
  if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) fail("public key is not RSA");
  return RsaPublicKey(std::move(key));
}

std::vector<uint8_t> RsaPublicKey::encrypt_oaep(const std::vector<uint8_t>& plaintext) const {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(key_.get(), nullptr));
  if (!ctx) fail("EVP_PKEY_CTX_new failed");
  if (EVP_PKEY_encrypt_init(ctx.get()) <= 0 || !set_oaep_sha256(ctx.get()))
    fail("RSA-OAEP init failed");

  std::size_t outlen = 0;
  if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outlen, plaintext.data(), plaintext.size()) <= 0)
    fail("RSA-OAEP encrypt failed");
  std::vector<uint8_t> out(outlen);
  if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outlen, plaintext.data(), plaintext.size()) <= 0)
    fail("RSA-OAEP encrypt failed");
  out.resize(outlen);
  return out;
}

// ---------- AES session ----------

SessionCipher::~SessionCipher(){ clear(); }

void SessionCipher::set_key(const std::vector<uint8_t>& key){
  if (key.size() != kSessionKeyBytes) throw CryptoError("session key must be 32 bytes");
  clear();
  key_ = key;
}

void SessionCipher::clear(){ wipe(key_); }

std::string SessionCipher::encrypt(const std::string& plaintext) const {
  if (key_.empty()) throw NoSessionKey();

  std::vector<uint8_t> out = random_bytes(kIvBytes);
  out.resize(kIvBytes + plaintext.size() + kIvBytes);

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) fail("EVP_CIPHER_CTX_new failed");
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), out.data()) != 1)
    fail("AES init failed");

  int len1 = 0, len2 = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data() + kIvBytes, &len1,
                        reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1)
    fail("AES encrypt failed");
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvBytes + len1, &len2) != 1)
    fail("AES encrypt failed");
  out.resize(kIvBytes + static_cast<std::size_t>(len1 + len2));
  return base64_encode(out);
}

std::string SessionCipher::decrypt(const std::string& frame) const {
  if (key_.empty()) throw NoSessionKey();

  auto raw = base64_decode(frame);
  if (!raw) throw DecryptionFailure("frame is not base64");
  if (raw->size() < 2 * kIvBytes || (raw->size() - kIvBytes) % kIvBytes != 0)
    throw DecryptionFailure("frame has invalid length");

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) fail_decrypt("EVP_CIPHER_CTX_new failed");
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key_.data(), raw->data()) != 1)
    fail_decrypt("AES init failed");

  const std::size_t ct_len = raw->size() - kIvBytes;
  std::string out(ct_len + kIvBytes, '\0');
  int len1 = 0, len2 = 0;
  if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &len1,
                        raw->data() + kIvBytes, static_cast<int>(ct_len)) != 1)
    fail_decrypt("AES decrypt failed");
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]) + len1, &len2) != 1)
    fail_decrypt("bad padding");
  out.resize(static_cast<std::size_t>(len1 + len2));
  return out;
}

} // namespace crypto
} // namespace relaychat
