#include "crypto/handshake.hpp"

namespace relaychat {

const char* const kStepServerPublicKey  = "server_public_key";
const char* const kStepClientSessionKey = "client_session_key";
const char* const kStepComplete         = "complete";

namespace {

const KeyExchange& expect_step(const Envelope& env, const char* step){
  if (env.type != MessageType::KeyExchange)
    throw HandshakeFailure(std::string("expected KEY_EXCHANGE, got ") + to_string(env.type));
  const auto* kx = std::get_if<KeyExchange>(&env.data);
  if (!kx) throw HandshakeFailure("KEY_EXCHANGE without key material");
  if (kx->step != step)
    throw HandshakeFailure("unexpected handshake step '" + kx->step + "', expected '" + step + "'");
  return *kx;
}

void expect_state(HandshakeState have, HandshakeState want){
  if (have != want)
    throw HandshakeFailure(std::string("handshake out of order: state is ") + to_string(have) +
                           ", step needs " + to_string(want));
}

} // namespace

const char* to_string(HandshakeState s){
  switch (s){
    case HandshakeState::NoKey:           return "NoKey";
    case HandshakeState::AwaitingPeerKey: return "AwaitingPeerKey";
    case HandshakeState::Established:     return "Established";
  }
  return "?";
}

// ---------- server ----------

ServerHandshake::ServerHandshake(const crypto::RsaKeyPair& server_key)
  : server_key_(server_key) {}

Envelope ServerHandshake::begin(const std::string& username){
  expect_state(state_, HandshakeState::NoKey);
  KeyExchange kx;
  kx.step = kStepServerPublicKey;
  kx.public_key = server_key_.public_key_pem_b64();
  username_ = username;
  state_ = HandshakeState::AwaitingPeerKey;
  return make_key_exchange(kServerName, username, std::move(kx));
}

Envelope ServerHandshake::accept(const Envelope& reply){
  expect_state(state_, HandshakeState::AwaitingPeerKey);
  const KeyExchange& kx = expect_step(reply, kStepClientSessionKey);
  if (kx.encrypted_session_key.empty()) throw HandshakeFailure("no encrypted session key");

  auto wrapped = crypto::base64_decode(kx.encrypted_session_key);
  if (!wrapped) throw HandshakeFailure("encrypted session key is not base64");

  std::vector<uint8_t> key;
  try {
    key = server_key_.decrypt_oaep(*wrapped);
    cipher_.set_key(key);
  } catch (const crypto::CryptoError& e){
    crypto::wipe(key);
    throw HandshakeFailure(std::string("session key rejected: ") + e.what());
  }
  crypto::wipe(key);

  state_ = HandshakeState::Established;
  KeyExchange ack;
  ack.step = kStepComplete;
  return make_key_exchange(kServerName, username_, std::move(ack));
}

void ServerHandshake::reset(){
  cipher_.clear();
  state_ = HandshakeState::NoKey;
}

// ---------- client ----------

Envelope ClientHandshake::on_server_key(const Envelope& offer, const std::string& username){
  expect_state(state_, HandshakeState::NoKey);
  const KeyExchange& kx = expect_step(offer, kStepServerPublicKey);
  if (kx.public_key.empty()) throw HandshakeFailure("no server public key");

  try {
    auto server_pub = crypto::RsaPublicKey::from_pem_b64(kx.public_key);
    auto key = crypto::random_bytes(crypto::kSessionKeyBytes);
    cipher_.set_key(key);
    KeyExchange out;
    out.step = kStepClientSessionKey;
    out.encrypted_session_key = crypto::base64_encode(server_pub.encrypt_oaep(key));
    crypto::wipe(key);
    state_ = HandshakeState::AwaitingPeerKey;
    return make_key_exchange(username, kServerName, std::move(out));
  } catch (const crypto::CryptoError& e){
    cipher_.clear();
    throw HandshakeFailure(std::string("cannot wrap session key: ") + e.what());
  }
}

void ClientHandshake::on_complete(const Envelope& ack){
  expect_state(state_, HandshakeState::AwaitingPeerKey);
  expect_step(ack, kStepComplete);
  state_ = HandshakeState::Established;
}

void ClientHandshake::reset(){
  cipher_.clear();
  state_ = HandshakeState::NoKey;
}

} // namespace relaychat
