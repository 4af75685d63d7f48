#ifndef RELAYCHAT_NET_SERVER_HPP
#define RELAYCHAT_NET_SERVER_HPP

#include "chat/router.hpp"
#include "config/config.hpp"
#include "crypto/crypto.hpp"
#include "net/protocol.hpp"
#include "net/session.hpp"
#include "storage/db.hpp"
#include "util/utils.hpp"

#include <condition_variable>
#include <vector>
#include <memory>
#include <string>
#include <atomic>
#include <mutex>
#include <thread>

namespace relaychat {

class Server {
public:
  explicit Server(const ServerConfig& cfg);
  ~Server();

  bool start();
  void stop();

  // Bound port, useful when configured with port 0.
  uint16_t port() const { return port_; }

  Router& router(){ return *router_; }
  Db& db(){ return db_; }

private:
  bool load_or_create_key();
  void accept_loop();
  static void client_thread(Server* self, std::shared_ptr<Session> s);
  bool open_session(const std::shared_ptr<Session>& s, FrameReader& reader, bool& registered);
  void read_loop(const std::shared_ptr<Session>& s, FrameReader& reader);
  bool next_frame(const std::shared_ptr<Session>& s, FrameReader& reader, std::string& frame);

private:
  ServerConfig cfg_;
  socket_t srv_{INVALID_SOCK};
  uint16_t port_{0};
  std::atomic<bool> stop_{false};
  std::thread accept_thr_;

  Db db_;
  std::unique_ptr<crypto::RsaKeyPair> key_;
  std::unique_ptr<Router> router_;

  std::mutex conns_mx_;
  std::condition_variable conns_cv_;
  std::vector<std::shared_ptr<Session>> conns_;
  std::size_t active_ = 0;
};

}

#endif
