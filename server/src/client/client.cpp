#include "client/client.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>

#ifndef _WIN32
  #include <netdb.h>
#endif

namespace relaychat {

namespace {

constexpr int kHandshakeTimeoutMs = 10000;

std::string bare_name(const std::string& s, const char* fallback){
  std::string n = std::filesystem::path(s).filename().string();
  if (n.empty() || n == "." || n == "..") return fallback;
  return n;
}

} // namespace

ChatClient::ChatClient(const ClientConfig& cfg)
  : cfg_(cfg),
    method_(wait_method_from_string(cfg.io_method).value_or(default_wait_method())),
    reader_(cfg.max_frame, cfg.max_buffer) {}

std::string attachment_path(const std::string& dir, const std::string& sender,
                            const std::string& filename){
  const std::string name = bare_name(sender, "unknown") + "_" + bare_name(filename, "file");
  return (std::filesystem::path(dir) / name).string();
}

ChatClient::~ChatClient(){ disconnect(); }

bool ChatClient::open_socket(std::string& err){
#ifdef _WIN32
  WSADATA wsa; if (WSAStartup(MAKEWORD(2,2), &wsa)!=0){ err = "WSAStartup failed"; return false; }
#endif
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(cfg_.port);
  if (getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res) != 0 || !res){
    err = "cannot resolve " + cfg_.host;
    return false;
  }
  for (addrinfo* ai = res; ai; ai = ai->ai_next){
    socket_t s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (s == INVALID_SOCK) continue;
    if (::connect(s, ai->ai_addr, static_cast<int>(ai->ai_addrlen)) != SOCK_ERROR){
      sock_ = s;
      break;
    }
    CLOSESOCK(s);
  }
  freeaddrinfo(res);
  if (sock_ == INVALID_SOCK){
    err = "cannot connect to " + cfg_.host + ":" + port;
    return false;
  }
  return true;
}

// Handshake-phase read: one cleartext envelope within the handshake timeout.
bool ChatClient::read_plain(Envelope& out, std::string& err){
  ReadinessWaiter waiter(sock_, method_);
  int waited = 0;
  std::string frame;
  while (!reader_.pop(frame)){
    if (waited >= kHandshakeTimeoutMs){ err = "timed out waiting for server"; return false; }
    const int slice = static_cast<int>(cfg_.wait_timeout_ms);
    auto w = waiter.wait_readable(slice);
    if (w == WaitResult::Error){ err = "wait failed"; return false; }
    if (w == WaitResult::Timeout){ waited += slice; continue; }
    auto st = reader_.pump(sock_);
    if (st == FrameReader::Status::Closed){ err = "server closed the connection"; return false; }
    if (st == FrameReader::Status::Error){ err = "receive failed"; return false; }
  }
  auto env = decode(frame);
  if (!env){ err = "malformed envelope from server"; return false; }
  out = std::move(*env);
  return true;
}

bool ChatClient::connect(std::string& err){
  if (running_.load() || sock_ != INVALID_SOCK){ err = "already connected"; return false; }
  hs_.reset();
  if (!open_socket(err)) return false;

  Envelope env;
  if (!send_frame(sock_, encode(make_connect(cfg_.username)))){
    err = "send failed";
    close_socket();
    return false;
  }
  if (!read_plain(env, err)){ close_socket(); return false; }
  if (env.type != MessageType::Success){
    err = env.text.value_or("connection refused");
    close_socket();
    return false;
  }
  if (cfg_.verbose) std::cout << "[client] " << env.text.value_or("") << "\n";

  try {
    if (!read_plain(env, err)){ close_socket(); return false; }
    Envelope reply = hs_.on_server_key(env, cfg_.username);
    if (!send_frame(sock_, encode(reply))){
      err = "send failed";
      close_socket();
      return false;
    }
    if (!read_plain(env, err)){ close_socket(); return false; }
    hs_.on_complete(env);
  } catch (const HandshakeFailure& e){
    err = std::string("handshake failed: ") + e.what();
    close_socket();
    return false;
  }
  if (cfg_.verbose)
    std::cout << "[client] session established, waiting with " << to_string(method_) << "\n";

  running_ = true;
  thr_ = std::thread([this]{ recv_loop(); });
  return true;
}

void ChatClient::recv_loop(){
  ReadinessWaiter waiter(sock_, method_);
  while (running_.load()){
    std::string frame;
    if (!reader_.pop(frame)){
      auto w = waiter.wait_readable(static_cast<int>(cfg_.wait_timeout_ms));
      if (w == WaitResult::Timeout) continue;
      if (w == WaitResult::Error) break;
      auto st = reader_.pump(sock_);
      if (st == FrameReader::Status::Closed || st == FrameReader::Status::Error) break;
      if (st == FrameReader::Status::Overflow)
        std::cerr << "[client] oversized frame dropped\n";
      continue;
    }

    std::string plain;
    try {
      plain = hs_.cipher().decrypt(frame);
    } catch (const crypto::CryptoError& e){
      std::cerr << "[client] dropped frame: " << e.what() << "\n";
      continue;
    }
    auto env = decode(plain);
    if (!env){
      std::cerr << "[client] malformed envelope ignored\n";
      continue;
    }
    if (handler_) handler_(*env);
  }
  if (running_.exchange(false) && cfg_.verbose)
    std::cout << "[client] connection closed by server\n";
}

void ChatClient::close_socket(){
  if (sock_ != INVALID_SOCK){ CLOSESOCK(sock_); sock_ = INVALID_SOCK; }
}

void ChatClient::disconnect(){
  if (sock_ == INVALID_SOCK) return;
  if (running_.exchange(false)) send(make_disconnect(cfg_.username));
  ::shutdown(sock_, SHUTDOWN_BOTH);
  if (thr_.joinable()) thr_.join();
  close_socket();
  std::lock_guard<std::mutex> lk(send_mx_);
  hs_.reset();
#ifdef _WIN32
  WSACleanup();
#endif
}

bool ChatClient::send(const Envelope& env){
  std::lock_guard<std::mutex> lk(send_mx_);
  if (sock_ == INVALID_SOCK) return false;
  std::string frame;
  try {
    frame = hs_.cipher().encrypt(encode(env));
  } catch (const crypto::CryptoError& e){
    std::cerr << "[client] cannot send " << to_string(env.type) << ": " << e.what() << "\n";
    return false;
  }
  return send_frame(sock_, frame);
}

bool ChatClient::send_private(const std::string& to, const std::string& text){
  return send(make_private(cfg_.username, to, text));
}

bool ChatClient::send_group(const std::string& group, const std::string& text){
  return send(make_group(cfg_.username, group, text));
}

bool ChatClient::send_file(const std::string& target, const std::string& path, bool is_group, std::string& err){
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec){ err = "cannot read " + path; return false; }
  if (size > cfg_.max_file_size){
    err = "file exceeds " + std::to_string(cfg_.max_file_size / (1024 * 1024)) + " MB limit";
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()){ err = "cannot open " + path; return false; }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return send_file_bytes(target, std::filesystem::path(path).filename().string(), bytes, is_group, err);
}

bool ChatClient::send_file_bytes(const std::string& target, const std::string& filename,
                                 const std::string& bytes, bool is_group, std::string& err){
  if (bytes.size() > cfg_.max_file_size){
    err = "file exceeds " + std::to_string(cfg_.max_file_size / (1024 * 1024)) + " MB limit";
    return false;
  }
  if (!send(make_file(cfg_.username, target, filename, crypto::base64_encode(bytes), is_group))){
    err = "send failed";
    return false;
  }
  return true;
}

bool ChatClient::create_group(const std::string& name){
  return send(make_create_group(cfg_.username, name));
}

bool ChatClient::join_group(const std::string& name){
  return send(make_join_group(cfg_.username, name));
}

bool ChatClient::request_users(){ return send(make_list_users(cfg_.username)); }
bool ChatClient::request_groups(){ return send(make_list_groups(cfg_.username)); }

bool ChatClient::request_history(const std::string& other, bool is_group){
  return send(make_history_request(cfg_.username, other, is_group));
}

} // namespace relaychat
