#include "net/session.hpp"

#include <iostream>

namespace relaychat {

Session::Session(socket_t sock, const crypto::RsaKeyPair& server_key)
  : sock_(sock), handshake_(server_key) {}

Session::~Session(){
  std::lock_guard<std::mutex> lk(send_mx_);
  handshake_.reset();
}

bool Session::send(const Envelope& env){
  return send_serialized(encode(env));
}

bool Session::send_serialized(const std::string& json_text){
  if (!alive_.load()) return false;
  std::lock_guard<std::mutex> lk(send_mx_);
  std::string frame;
  try {
    frame = handshake_.cipher().encrypt(json_text);
  } catch (const crypto::CryptoError& e){
    std::cerr << "[server] encrypt for '" << username_ << "' failed: " << e.what() << "\n";
    return false;
  }
  return send_frame(sock_, frame);
}

bool Session::send_plain(const Envelope& env){
  if (!alive_.load()) return false;
  std::lock_guard<std::mutex> lk(send_mx_);
  return send_frame(sock_, encode(env));
}

std::string Session::decrypt(const std::string& frame) const {
  std::lock_guard<std::mutex> lk(send_mx_);
  return handshake_.cipher().decrypt(frame);
}

void Session::mark_dead(){
  if (alive_.exchange(false)) ::shutdown(sock_, SHUTDOWN_BOTH);
}

void Session::discard_key(){
  std::lock_guard<std::mutex> lk(send_mx_);
  handshake_.reset();
}

} // namespace relaychat
