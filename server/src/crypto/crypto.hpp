#ifndef RELAYCHAT_CRYPTO_CRYPTO_HPP
#define RELAYCHAT_CRYPTO_CRYPTO_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace relaychat {
namespace crypto {

constexpr std::size_t kSessionKeyBytes = 32;  // AES-256
constexpr std::size_t kIvBytes         = 16;  // AES block
constexpr int         kRsaBits         = 2048;

class CryptoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NoSessionKey : public CryptoError {
public:
  NoSessionKey() : CryptoError("no session key established") {}
};

class DecryptionFailure : public CryptoError {
public:
  using CryptoError::CryptoError;
};

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& data);
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

std::vector<uint8_t> random_bytes(std::size_t n);
void wipe(std::vector<uint8_t>& secret);

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const;
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

/**
 * Long-lived server RSA key. Only used to unwrap client session keys
 * (RSA-OAEP, SHA-256 for both the digest and MGF1).
 */
class RsaKeyPair {
public:
  static RsaKeyPair generate(int bits = kRsaBits);
  static std::optional<RsaKeyPair> load_pem_file(const std::string& path);

  bool save_pem_file(const std::string& path) const;

  // base64 of the SubjectPublicKeyInfo PEM, the form sent in the handshake
  std::string public_key_pem_b64() const;

  // throws DecryptionFailure
  std::vector<uint8_t> decrypt_oaep(const std::vector<uint8_t>& ciphertext) const;

private:
  explicit RsaKeyPair(PkeyPtr key) : key_(std::move(key)) {}
  PkeyPtr key_;
};

class RsaPublicKey {
public:
  // throws CryptoError
  static RsaPublicKey from_pem_b64(const std::string& pem_b64);

  std::vector<uint8_t> encrypt_oaep(const std::vector<uint8_t>& plaintext) const;

private:
  explicit RsaPublicKey(PkeyPtr key) : key_(std::move(key)) {}
  PkeyPtr key_;
};

/**
 * AES-256-CBC with a fresh random IV per call.
 * Frame = base64(iv[16] || ciphertext), PKCS7 padding.
 */
class SessionCipher {
public:
  SessionCipher() = default;
  ~SessionCipher();
  SessionCipher(const SessionCipher&) = delete;
  SessionCipher& operator=(const SessionCipher&) = delete;

  void set_key(const std::vector<uint8_t>& key);
  bool has_key() const { return !key_.empty(); }
  void clear();

  std::string encrypt(const std::string& plaintext) const;
  std::string decrypt(const std::string& frame) const;

private:
  std::vector<uint8_t> key_;
};

} // namespace crypto
} // namespace relaychat

#endif // RELAYCHAT_CRYPTO_CRYPTO_HPP
