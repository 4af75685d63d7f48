#ifndef RELAYCHAT_NET_SESSION_HPP
#define RELAYCHAT_NET_SESSION_HPP

#include "crypto/handshake.hpp"
#include "net/protocol.hpp"
#include "util/utils.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace relaychat {

/**
 * One accepted connection. Sends are serialized by an internal mutex so the
 * owning thread and the router (delivering from other threads) never
 * interleave frames on the socket.
 */
class Session {
public:
  Session(socket_t sock, const crypto::RsaKeyPair& server_key);
  ~Session();
  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  socket_t sock() const { return sock_; }

  const std::string& username() const { return username_; }
  void set_username(const std::string& name){ username_ = name; }

  ServerHandshake& handshake(){ return handshake_; }

  // Encrypted send; false when the peer is gone or there is no session key.
  bool send(const Envelope& env);
  // Encrypts an already encoded envelope (offline queue content).
  bool send_serialized(const std::string& json_text);
  // Cleartext, only before the key exchange completes.
  bool send_plain(const Envelope& env);

  // throws crypto::NoSessionKey / crypto::DecryptionFailure
  std::string decrypt(const std::string& frame) const;

  bool alive() const { return alive_.load(); }
  // Shuts the socket down so a blocked reader wakes up; close happens in the owner.
  void mark_dead();
  void discard_key();

private:
  socket_t          sock_;
  std::string       username_;
  ServerHandshake   handshake_;
  mutable std::mutex send_mx_;
  std::atomic<bool> alive_{true};
};

} // namespace relaychat

#endif
