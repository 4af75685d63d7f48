#include "config.hpp"

#include <filesystem>
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <string>

namespace relaychat {

static std::string default_ini_path(){
  return std::string("data") + "/" + "server.ini";
}

static std::string in_data_dir(const std::string& dir, const std::string& file){
  std::filesystem::path p(file);
  if (p.is_absolute() || dir.empty()) return file;
  return (std::filesystem::path(dir) / p).string();
}

std::string ServerConfig::db_path() const { return in_data_dir(data_dir, db_file); }
std::string ServerConfig::key_path() const { return in_data_dir(data_dir, key_file); }

static void trim(std::string& s){
  size_t a = s.find_first_not_of(" \t\r\n");
  size_t b = s.find_last_not_of(" \t\r\n");
  if (a==std::string::npos){ s.clear(); return; }
  s = s.substr(a, b-a+1);
}

static bool parse_num(const std::string& v, unsigned long long lo, unsigned long long hi,
                      unsigned long long& out){
  if (v.empty() || v[0]=='-' || v[0]=='+') return false;
  size_t used = 0;
  try {
    out = std::stoull(v, &used);
  } catch (const std::exception&){
    return false;
  }
  return used == v.size() && out >= lo && out <= hi;
}

template <typename T>
static bool set_num(const std::string& key, const std::string& val,
                    unsigned long long lo, unsigned long long hi,
                    T& dst, std::string& err){
  unsigned long long n = 0;
  if (!parse_num(val, lo, hi, n)){
    err = "invalid value for " + key + ": '" + val + "'";
    return false;
  }
  dst = static_cast<T>(n);
  return true;
}

static bool parse_flag(const std::string& val, bool& dst){
  if (val=="1" || val=="true" || val=="yes" || val=="on")  { dst = true;  return true; }
  if (val=="0" || val=="false" || val=="no" || val=="off") { dst = false; return true; }
  return false;
}

// One option shared by the ini file and the command line. known=false for foreign keys.
static bool set_server_option(ServerConfig& cfg, const std::string& key, const std::string& val,
                              bool& known, std::string& err){
  known = true;
  if      (key=="bind") cfg.bind_addr = val;
  else if (key=="port") return set_num(key, val, 0, 65535, cfg.port, err);
  else if (key=="data") cfg.data_dir = val;
  else if (key=="db")   cfg.db_file  = val;
  else if (key=="key")  cfg.key_file = val;
  else if (key=="buffer")       return set_num(key, val, 1024, 1u<<30, cfg.max_buffer, err);
  else if (key=="max_frame")    return set_num(key, val, 1024, 1u<<30, cfg.max_frame, err);
  else if (key=="hist")         return set_num(key, val, 1, 100000, cfg.history_limit, err);
  else if (key=="max_file")     return set_num(key, val, 1, 1u<<30, cfg.max_file_size, err);
  else if (key=="notice_delay") return set_num(key, val, 0, 60000, cfg.notice_delay_ms, err);
  else if (key=="pacing")       return set_num(key, val, 0, 60000, cfg.pacing_ms, err);
  else if (key=="verbose"){
    if (!parse_flag(val, cfg.verbose)){ err = "invalid value for verbose: '" + val + "'"; return false; }
  }
  else known = false;
  return true;
}

void print_server_usage(const char* argv0){
  std::cout <<
    "Relay Chat Server\n"
    "Usage: " << argv0 <<
    " [--config data/server.ini]"
    " [--bind 0.0.0.0]"
    " [--port 5555]"
    " [--data ./data]"
    " [--db chat.db]"
    " [--key server_key.pem]"
    " [--buffer 131072]"
    " [--max-frame 33554432]"
    " [--hist 20]"
    " [--max-file 10485760]"
    " [--notice-delay 100]"
    " [--pacing 200]"
    " [--verbose]\n";
}

void print_client_usage(const char* argv0){
  std::cout <<
    "Relay Chat Client\n"
    "Usage: " << argv0 <<
    " --user NAME"
    " [--host 127.0.0.1]"
    " [--port 5555]"
    " [--io select|poll|epoll]"
    " [--timeout 1000]"
    " [--buffer 131072]"
    " [--max-file 10485760]"
    " [--verbose]\n";
}

ParseResult parse_server_args(int argc, char** argv, ServerConfig& cfg, std::string& err){
  for (int i = 1; i < argc; ++i){
    std::string a = argv[i];
    if (a == "-h" || a == "--help") return ParseResult::Help;
    if (a == "--verbose"){ cfg.verbose = true; continue; }
    if (a.rfind("--", 0) != 0){ err = "unknown arg: " + a; return ParseResult::Error; }
    if (i+1 >= argc){ err = "missing " + a + " value"; return ParseResult::Error; }
    std::string val = argv[++i];
    if (a == "--config") continue;  // consumed by bootstrap_server_config

    std::string key = a.substr(2);
    for (auto& c : key) if (c=='-') c = '_';
    bool known = false;
    if (!set_server_option(cfg, key, val, known, err)) return ParseResult::Error;
    if (!known){ err = "unknown arg: " + a; return ParseResult::Error; }
  }
  return ParseResult::Ok;
}

ParseResult parse_client_args(int argc, char** argv, ClientConfig& cfg, std::string& err){
  for (int i = 1; i < argc; ++i){
    std::string a = argv[i];
    if (a == "-h" || a == "--help") return ParseResult::Help;
    if (a == "--verbose"){ cfg.verbose = true; continue; }
    if (i+1 >= argc){ err = "missing " + a + " value"; return ParseResult::Error; }
    std::string val = argv[++i];

    if      (a == "--host") cfg.host = val;
    else if (a == "--user") cfg.username = val;
    else if (a == "--port"){
      if (!set_num("port", val, 1, 65535, cfg.port, err)) return ParseResult::Error;
    }
    else if (a == "--io"){
      if (val != "select" && val != "poll" && val != "epoll"){
        err = "--io must be select, poll or epoll";
        return ParseResult::Error;
      }
      cfg.io_method = val;
    }
    else if (a == "--timeout"){
      if (!set_num("timeout", val, 1, 60000, cfg.wait_timeout_ms, err)) return ParseResult::Error;
    }
    else if (a == "--buffer"){
      if (!set_num("buffer", val, 1024, 1u<<30, cfg.max_buffer, err)) return ParseResult::Error;
    }
    else if (a == "--max-file"){
      if (!set_num("max_file", val, 1, 1u<<30, cfg.max_file_size, err)) return ParseResult::Error;
    }
    else { err = "unknown arg: " + a; return ParseResult::Error; }
  }
  if (cfg.username.empty()){ err = "--user is required"; return ParseResult::Error; }
  return ParseResult::Ok;
}

bool load_config_file(const std::string& path, ServerConfig& cfg, std::string& err){
  std::ifstream in(path);
  if (!in.is_open()){ err = "cannot open " + path; return false; }

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)){
    ++lineno;
    trim(line);
    if (line.empty()) continue;
    if (line[0]=='#' || line[0]==';') continue;

    size_t eq = line.find('=');
    if (eq==std::string::npos) continue;
    std::string key = line.substr(0, eq);
    std::string val = line.substr(eq+1);
    trim(key); trim(val);
    bool known = false;
    if (!set_server_option(cfg, key, val, known, err)){
      err = path + ":" + std::to_string(lineno) + ": " + err;
      return false;
    }
  }
  return true;
}

bool save_config_file(const std::string& path, const ServerConfig& cfg){
  std::error_code ec;
  std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) return false;

  out << "# Relay Chat Server config\n";
  out << "bind=" << cfg.bind_addr << "\n";
  out << "port=" << cfg.port << "\n";
  out << "data=" << cfg.data_dir << "\n";
  out << "db=" << cfg.db_file << "\n";
  out << "key=" << cfg.key_file << "\n";
  out << "buffer=" << cfg.max_buffer << "\n";
  out << "max_frame=" << cfg.max_frame << "\n";
  out << "hist=" << cfg.history_limit << "\n";
  out << "max_file=" << cfg.max_file_size << "\n";
  out << "notice_delay=" << cfg.notice_delay_ms << "\n";
  out << "pacing=" << cfg.pacing_ms << "\n";
  out << "verbose=" << (cfg.verbose ? "1" : "0") << "\n";
  out.flush();
  return out.good();
}

ParseResult bootstrap_server_config(int argc, char** argv, ServerConfig& cfg, std::string& err){
  std::string ini = default_ini_path();
  for (int i = 1; i + 1 < argc; ++i){
    if (std::string(argv[i]) == "--config") ini = argv[i+1];
  }

  const bool ini_exists = std::filesystem::exists(ini);
  if (ini_exists && !load_config_file(ini, cfg, err)) return ParseResult::Error;

  ParseResult r = parse_server_args(argc, argv, cfg, err);
  if (r != ParseResult::Ok) return r;

  if (!ini_exists){
    if (save_config_file(ini, cfg)) std::cout << "[server] wrote default config to " << ini << "\n";
    else std::cerr << "[server] could not write " << ini << "\n";
  }

  std::cout << "Config: bind=" << cfg.bind_addr
            << " port=" << cfg.port
            << " data=" << cfg.data_dir
            << " db=" << cfg.db_path()
            << " hist=" << cfg.history_limit
            << (cfg.verbose ? " verbose" : "")
            << "\n";
  return ParseResult::Ok;
}

}
