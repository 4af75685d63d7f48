#include "net/server.hpp"
#include "crypto/handshake.hpp"

#include <iostream>
#include <algorithm>
#include <chrono>
#include <cstring>

#ifdef _WIN32
  #include <windows.h>
#endif

namespace relaychat {

Server::Server(const ServerConfig& cfg)
  : cfg_(cfg) {}

Server::~Server(){ stop(); }

bool Server::load_or_create_key(){
  const std::string path = cfg_.key_path();
  if (auto k = crypto::RsaKeyPair::load_pem_file(path)){
    key_ = std::make_unique<crypto::RsaKeyPair>(std::move(*k));
    std::cout << "[server] loaded RSA key from " << path << "\n";
    return true;
  }
  try {
    key_ = std::make_unique<crypto::RsaKeyPair>(crypto::RsaKeyPair::generate());
  } catch (const crypto::CryptoError& e){
    std::cerr << "[server] RSA key generation failed: " << e.what() << "\n";
    return false;
  }
  if (key_->save_pem_file(path)) std::cout << "[server] generated RSA key, saved to " << path << "\n";
  else std::cerr << "[server] generated RSA key, could not save to " << path << "\n";
  return true;
}

bool Server::start(){
#ifdef _WIN32
  WSADATA wsa; if (WSAStartup(MAKEWORD(2,2), &wsa)!=0){ std::cerr<<"WSAStartup failed\n"; return false; }
#endif

  if (!db_.open(cfg_.db_path())){
    std::cerr<<"[server] cannot open database "<<cfg_.db_path()<<"\n";
    return false;
  }
  if (!load_or_create_key()) return false;

  RouterOptions opts;
  opts.history_limit = cfg_.history_limit;
  opts.notice_delay = std::chrono::milliseconds(cfg_.notice_delay_ms);
  opts.pacing = std::chrono::milliseconds(cfg_.pacing_ms);
  opts.verbose = cfg_.verbose;
  router_ = std::make_unique<Router>(db_, opts);
  router_->load_groups();
  std::cout<<"[server] store has "<<db_.all_users().size()<<" registered user(s), "
           <<db_.all_groups().size()<<" group(s)\n";

  srv_ = socket(AF_INET, SOCK_STREAM, 0);
  if (srv_ == INVALID_SOCK){ std::cerr<<"socket() failed\n"; return false; }

  int yes=1;
  setsockopt(srv_, SOL_SOCKET, SO_REUSEADDR, (char*)&yes, sizeof(yes));

  sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_port = htons(cfg_.port);
  if (inet_pton(AF_INET, cfg_.bind_addr.c_str(), &addr.sin_addr) != 1){
    std::cerr<<"Bad bind address\n"; return false;
  }
  if (bind(srv_, (sockaddr*)&addr, sizeof(addr)) == SOCK_ERROR){
    std::cerr<<"bind() failed: "<<GET_LAST_SOCK_ERR<<"\n"; return false;
  }
  if (listen(srv_, 16) == SOCK_ERROR){
    std::cerr<<"listen() failed\n"; return false;
  }

  sockaddr_in bound{}; socklen_t blen = sizeof(bound);
  if (getsockname(srv_, (sockaddr*)&bound, &blen) == 0) port_ = ntohs(bound.sin_port);
  else port_ = cfg_.port;

  accept_thr_ = std::thread([this]{ accept_loop(); });
  std::cout<<"[server] listening on "<<cfg_.bind_addr<<":"<<port_
           <<" | db="<<cfg_.db_path()<<"\n";
  return true;
}

void Server::stop(){
  if (stop_.exchange(true)) return;
  if (srv_!=INVALID_SOCK) ::shutdown(srv_, SHUTDOWN_BOTH);
  if (accept_thr_.joinable()) accept_thr_.join();
  if (srv_!=INVALID_SOCK){ CLOSESOCK(srv_); srv_=INVALID_SOCK; }

  // wake every handler, then wait for them to leave
  std::unique_lock<std::mutex> lk(conns_mx_);
  for (auto& c : conns_) c->mark_dead();
  if (!conns_cv_.wait_for(lk, std::chrono::seconds(5), [this]{ return active_ == 0; }))
    std::cerr<<"[server] "<<active_<<" connection handler(s) still running at shutdown\n";
  lk.unlock();

  std::cout<<"[server] stopped\n";
#ifdef _WIN32
  WSACleanup();
#endif
}

void Server::accept_loop(){
  while(!stop_.load()){
    sockaddr_in caddr{}; socklen_t clen=sizeof(caddr);
    socket_t cs = accept(srv_, (sockaddr*)&caddr, &clen);
    if (cs==INVALID_SOCK){
      if (stop_.load()) break;
      continue;
    }
    auto s = std::make_shared<Session>(cs, *key_);
    {
      std::lock_guard<std::mutex> lk(conns_mx_);
      if (stop_.load()){ CLOSESOCK(cs); break; }
      conns_.push_back(s);
      ++active_;
    }
    if (cfg_.verbose){
      char ip[INET_ADDRSTRLEN] = {0};
      inet_ntop(AF_INET, &caddr.sin_addr, ip, sizeof(ip));
      std::cout<<"[server] connection from "<<ip<<":"<<ntohs(caddr.sin_port)<<"\n";
    }
    std::thread(client_thread, this, s).detach();
  }
}

bool Server::next_frame(const std::shared_ptr<Session>& s, FrameReader& reader, std::string& frame){
  while (!reader.pop(frame)){
    if (stop_.load()) return false;
    auto st = reader.pump(s->sock());
    if (st == FrameReader::Status::Closed || st == FrameReader::Status::Error) return false;
    if (st == FrameReader::Status::Overflow)
      std::cerr<<"[server] oversized frame from '"<<s->username()<<"' dropped\n";
  }
  return true;
}

// CONNECT -> welcome -> key exchange. false = close the connection.
bool Server::open_session(const std::shared_ptr<Session>& s, FrameReader& reader, bool& registered){
  std::string frame;
  if (!next_frame(s, reader, frame)) return false;

  auto hello = decode(frame);
  if (!hello || hello->type != MessageType::Connect || hello->sender.empty()){
    s->send_plain(make_error("Expected CONNECT with a username"));
    return false;
  }
  const std::string name = hello->sender;
  const RouteStatus reg = router_->register_session(s, name);
  if (reg == RouteStatus::BadRequest){
    std::cout<<"[server] rejected invalid username '"<<name<<"'\n";
    s->send_plain(make_error("Invalid username '" + name + "'"));
    return false;
  }
  if (reg == RouteStatus::UsernameTaken){
    std::cout<<"[server] rejected duplicate username '"<<name<<"'\n";
    s->send_plain(make_error("Username '" + name + "' is already taken"));
    return false;
  }
  registered = true;
  if (!s->send_plain(make_success("Welcome to RelayChat, " + name + "!"))) return false;

  try {
    if (!s->send_plain(s->handshake().begin(name))) return false;
    if (!next_frame(s, reader, frame)) return false;
    auto reply = decode(frame);
    if (!reply) throw HandshakeFailure("malformed key exchange reply");
    Envelope ack = s->handshake().accept(*reply);
    if (!s->send_plain(ack)) return false;
  } catch (const crypto::CryptoError& e){
    std::cerr<<"[handshake] '"<<name<<"': "<<e.what()<<"\n";
    return false;
  }
  std::cout<<"[handshake] session key established with '"<<name<<"'\n";
  return true;
}

void Server::read_loop(const std::shared_ptr<Session>& s, FrameReader& reader){
  while (!stop_.load() && s->alive()){
    std::string frame;
    if (!reader.pop(frame)){
      auto st = reader.pump(s->sock());
      if (st == FrameReader::Status::Closed || st == FrameReader::Status::Error) break;
      if (st == FrameReader::Status::Overflow)
        std::cerr<<"[server] oversized frame from '"<<s->username()<<"' dropped\n";
      continue;
    }

    std::string plain;
    try {
      plain = s->decrypt(frame);
    } catch (const crypto::CryptoError& e){
      std::cerr<<"[server] dropped frame from '"<<s->username()<<"': "<<e.what()<<"\n";
      continue;
    }

    auto env = decode(plain);
    if (!env){
      std::cerr<<"[server] malformed envelope from '"<<s->username()<<"' ignored\n";
      continue;
    }
    if (cfg_.verbose)
      std::cout<<"[server] "<<to_string(env->type)<<" from '"<<s->username()<<"'\n";
    if (!router_->dispatch(s, std::move(*env))) break;
  }
}

void Server::client_thread(Server* self, std::shared_ptr<Session> s){
  FrameReader reader(self->cfg_.max_frame, self->cfg_.max_buffer);
  bool registered = false;

  if (self->open_session(s, reader, registered)){
    const std::size_t flushed = self->router_->activate_session(s);
    if (flushed && self->cfg_.verbose)
      std::cout<<"[server] delivered "<<flushed<<" offline message(s) to '"<<s->username()<<"'\n";
    self->read_loop(s, reader);
  }

  if (registered) self->router_->disconnect(s);
  s->mark_dead();
  CLOSESOCK(s->sock());
  {
    std::lock_guard<std::mutex> lk(self->conns_mx_);
    self->conns_.erase(std::remove_if(self->conns_.begin(), self->conns_.end(),
      [&](const std::shared_ptr<Session>& c){ return c.get()==s.get(); }), self->conns_.end());
    --self->active_;
  }
  self->conns_cv_.notify_all();
}

} // namespace relaychat
