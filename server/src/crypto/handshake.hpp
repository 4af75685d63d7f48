#ifndef RELAYCHAT_CRYPTO_HANDSHAKE_HPP
#define RELAYCHAT_CRYPTO_HANDSHAKE_HPP

#include "crypto/crypto.hpp"
#include "net/protocol.hpp"

#include <string>

namespace relaychat {

// NoKey -> AwaitingPeerKey -> Established. Any other transition is a HandshakeFailure.
enum class HandshakeState { NoKey, AwaitingPeerKey, Established };

const char* to_string(HandshakeState s);

class HandshakeFailure : public crypto::CryptoError {
public:
  using crypto::CryptoError::CryptoError;
};

extern const char* const kStepServerPublicKey;
extern const char* const kStepClientSessionKey;
extern const char* const kStepComplete;

/**
 * Server side of the key exchange for one connection. Owns the session key
 * once established; the RSA key pair is shared by every connection.
 */
class ServerHandshake {
public:
  explicit ServerHandshake(const crypto::RsaKeyPair& server_key);

  HandshakeState state() const { return state_; }

  // KEY_EXCHANGE {step: server_public_key, public_key}
  Envelope begin(const std::string& username);

  // Consumes KEY_EXCHANGE {step: client_session_key, encrypted_session_key}
  // and returns the KEY_EXCHANGE {step: complete} acknowledgement.
  Envelope accept(const Envelope& reply);

  const crypto::SessionCipher& cipher() const { return cipher_; }

  // Discards the session key; back to NoKey.
  void reset();

private:
  const crypto::RsaKeyPair& server_key_;
  crypto::SessionCipher     cipher_;
  HandshakeState            state_ = HandshakeState::NoKey;
  std::string               username_;
};

/**
 * Client side: wraps a fresh random AES-256 key with the server's public key.
 */
class ClientHandshake {
public:
  ClientHandshake() = default;

  HandshakeState state() const { return state_; }

  // Consumes the server's public key offer, returns the wrapped session key.
  Envelope on_server_key(const Envelope& offer, const std::string& username);

  void on_complete(const Envelope& ack);

  const crypto::SessionCipher& cipher() const { return cipher_; }

  void reset();

private:
  crypto::SessionCipher cipher_;
  HandshakeState        state_ = HandshakeState::NoKey;
};

} // namespace relaychat

#endif
