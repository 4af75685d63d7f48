#ifndef RELAYCHAT_CLIENT_CLIENT_HPP
#define RELAYCHAT_CLIENT_CLIENT_HPP

#include "config/config.hpp"
#include "crypto/handshake.hpp"
#include "net/protocol.hpp"
#include "net/readiness.hpp"
#include "util/utils.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace relaychat {

// Where a received attachment is written: <dir>/<sender>_<filename>, both parts
// reduced to a bare file name so a hostile sender can't escape dir.
std::string attachment_path(const std::string& dir, const std::string& sender,
                            const std::string& filename);

/**
 * Client side of a chat connection: CONNECT, key exchange, then a background
 * receive loop that hands every decrypted envelope to the handler.
 *
 * The handler runs on the receive thread and must not call disconnect().
 */
class ChatClient {
public:
  using Handler = std::function<void(const Envelope&)>;

  explicit ChatClient(const ClientConfig& cfg);
  ~ChatClient();
  ChatClient(const ChatClient&) = delete;
  ChatClient& operator=(const ChatClient&) = delete;

  // Set before connect().
  void set_handler(Handler h){ handler_ = std::move(h); }

  // false with err set on refusal (e.g. username taken) or handshake failure.
  bool connect(std::string& err);
  void disconnect();

  bool connected() const { return running_.load(); }
  HandshakeState handshake_state() const { return hs_.state(); }
  WaitMethod wait_method() const { return method_; }
  const std::string& username() const { return cfg_.username; }

  bool send_private(const std::string& to, const std::string& text);
  bool send_group(const std::string& group, const std::string& text);
  bool send_file(const std::string& target, const std::string& path, bool is_group, std::string& err);
  bool send_file_bytes(const std::string& target, const std::string& filename,
                       const std::string& bytes, bool is_group, std::string& err);
  bool create_group(const std::string& name);
  bool join_group(const std::string& name);
  bool request_users();
  bool request_groups();
  bool request_history(const std::string& other, bool is_group);

private:
  bool open_socket(std::string& err);
  bool read_plain(Envelope& out, std::string& err);
  bool send(const Envelope& env);
  void recv_loop();
  void close_socket();

  ClientConfig      cfg_;
  WaitMethod        method_;
  socket_t          sock_ = INVALID_SOCK;
  ClientHandshake   hs_;
  FrameReader       reader_;
  Handler           handler_;
  std::mutex        send_mx_;
  std::atomic<bool> running_{false};
  std::thread       thr_;
};

} // namespace relaychat

#endif
