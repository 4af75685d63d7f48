#ifndef RELAYCHAT_CONFIG_CONFIG_HPP
#define RELAYCHAT_CONFIG_CONFIG_HPP

#include <string>
#include <cstddef>
#include <cstdint>

namespace relaychat {

struct ServerConfig {
  std::string bind_addr = "0.0.0.0";
  uint16_t    port = 5555;                  // 0 = any free port
  std::string data_dir = "data";
  std::string db_file = "chat.db";          // relative to data_dir unless absolute
  std::string key_file = "server_key.pem";  // relative to data_dir unless absolute

  std::size_t max_buffer = 131072;
  std::size_t max_frame = 32u * 1024 * 1024;
  std::size_t history_limit = 20;
  std::size_t max_file_size = 10u * 1024 * 1024;

  unsigned    notice_delay_ms = 100;
  unsigned    pacing_ms = 200;
  bool        verbose = false;

  std::string db_path() const;
  std::string key_path() const;
};

struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t    port = 5555;
  std::string username;
  std::string io_method = "epoll";   // select | poll | epoll
  unsigned    wait_timeout_ms = 1000;
  std::size_t max_buffer = 131072;
  std::size_t max_frame = 32u * 1024 * 1024;
  std::size_t max_file_size = 10u * 1024 * 1024;
  bool        verbose = false;
};

enum class ParseResult { Ok, Help, Error };

void print_server_usage(const char* argv0);
void print_client_usage(const char* argv0);

ParseResult parse_server_args(int argc, char** argv, ServerConfig& cfg, std::string& err);
ParseResult parse_client_args(int argc, char** argv, ClientConfig& cfg, std::string& err);

// key=value lines, '#' or ';' comments. Unknown keys are ignored.
bool load_config_file(const std::string& path, ServerConfig& cfg, std::string& err);
bool save_config_file(const std::string& path, const ServerConfig& cfg);

// defaults <- ini (--config PATH, default data/server.ini) <- command line.
// Writes the ini on first run.
ParseResult bootstrap_server_config(int argc, char** argv, ServerConfig& cfg, std::string& err);

}

#endif
