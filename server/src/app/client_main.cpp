#include "client/client.hpp"
#include "config/config.hpp"
#include "crypto/crypto.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#ifndef _WIN32
  #include <csignal>
#endif

namespace {

std::mutex g_out_mx;

void print_help(){
  std::cout <<
    "Commands:\n"
    "  /msg USER TEXT        private message\n"
    "  /group GROUP TEXT     group message\n"
    "  /file USER PATH       send a file to a user\n"
    "  /gfile GROUP PATH     send a file to a group\n"
    "  /create GROUP         create a group\n"
    "  /join GROUP           join a group\n"
    "  /users                list online users\n"
    "  /groups               list groups\n"
    "  /history USER         private history with USER\n"
    "  /ghistory GROUP       group history\n"
    "  /quit\n";
}

// Attachments land in ./downloads/<sender>_<name>.
void save_attachment(const relaychat::Envelope& env, const relaychat::FilePayload& f){
  auto bytes = relaychat::crypto::base64_decode(f.filedata);
  if (!bytes){
    std::cerr << "[client] attachment from " << env.sender << " is not valid base64\n";
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories("downloads", ec);
  const std::string out = relaychat::attachment_path("downloads", env.sender, f.filename);
  std::ofstream o(out, std::ios::binary | std::ios::trunc);
  if (!o.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()))){
    std::cerr << "[client] cannot write " << out << "\n";
    return;
  }
  std::cout << "[file] " << env.sender << " sent " << f.filename << " (" << bytes->size()
            << " bytes) -> " << out << "\n";
}

void show(const relaychat::Envelope& env){
  using relaychat::MessageType;
  std::lock_guard<std::mutex> lk(g_out_mx);
  switch (env.type){
    case MessageType::Private:
      std::cout << "[" << env.sender << "] " << env.text.value_or("") << "\n";
      break;
    case MessageType::Group:
      std::cout << "[" << env.receiver.value_or("?") << "] " << env.sender << ": "
                << env.text.value_or("") << "\n";
      break;
    case MessageType::File:
      if (const auto* f = std::get_if<relaychat::FilePayload>(&env.data)) save_attachment(env, *f);
      break;
    case MessageType::ListUsers:
      if (const auto* u = std::get_if<relaychat::UserList>(&env.data)){
        std::cout << "Online users (" << u->users.size() << "):\n";
        for (const auto& e : u->users) std::cout << "  " << e.username << " (" << e.status << ")\n";
      }
      break;
    case MessageType::ListGroups:
      if (const auto* g = std::get_if<relaychat::GroupList>(&env.data)){
        std::cout << "Groups (" << g->groups.size() << "):\n";
        for (const auto& e : g->groups) std::cout << "  " << e.name << " by " << e.creator << "\n";
      }
      break;
    case MessageType::HistoryResponse:
      if (const auto* h = std::get_if<relaychat::HistoryReply>(&env.data)){
        std::cout << "--- history: " << h->other_user << " (" << h->messages.size() << ") ---\n";
        for (const auto& m : h->messages)
          std::cout << "  " << m.timestamp << " " << m.sender << ": " << m.text << "\n";
      }
      break;
    case MessageType::Success:
      std::cout << "[ok] " << env.text.value_or("") << "\n";
      break;
    case MessageType::Error:
      std::cout << "[error] " << env.text.value_or("") << "\n";
      break;
    case MessageType::Offline:
      std::cout << "[offline] " << env.text.value_or("") << "\n";
      break;
    default:
      std::cout << "[" << relaychat::to_string(env.type) << "] from " << env.sender << "\n";
      break;
  }
}

// "WORD rest of line"
bool split_arg(const std::string& line, std::string& first, std::string& rest){
  std::istringstream in(line);
  if (!(in >> first)) return false;
  std::getline(in >> std::ws, rest);
  return true;
}

} // namespace

int main(int argc, char** argv){
  relaychat::ClientConfig cfg;
  std::string err;
  switch (relaychat::parse_client_args(argc, argv, cfg, err)){
    case relaychat::ParseResult::Help:
      relaychat::print_client_usage(argv[0]);
      return 0;
    case relaychat::ParseResult::Error:
      std::cerr << err << "\n";
      relaychat::print_client_usage(argv[0]);
      return 1;
    case relaychat::ParseResult::Ok:
      break;
  }

#ifndef _WIN32
  std::signal(SIGPIPE, SIG_IGN);
#endif

  relaychat::ChatClient client(cfg);
  client.set_handler(show);
  if (!client.connect(err)){
    std::cerr << "Connect failed: " << err << "\n";
    return 1;
  }
  std::cout << "Connected to " << cfg.host << ":" << cfg.port << " as " << cfg.username
            << " (" << relaychat::to_string(client.wait_method()) << "). /help for commands.\n";

  std::string line;
  while (client.connected() && std::getline(std::cin, line)){
    if (line.empty()) continue;
    std::string cmd, rest, target, text;
    split_arg(line, cmd, rest);
    bool ok = true;

    if (cmd == "/quit") break;
    else if (cmd == "/help") print_help();
    else if (cmd == "/users")  ok = client.request_users();
    else if (cmd == "/groups") ok = client.request_groups();
    else if (cmd == "/create" && !rest.empty()) ok = client.create_group(rest);
    else if (cmd == "/join" && !rest.empty())   ok = client.join_group(rest);
    else if (cmd == "/history" && !rest.empty())  ok = client.request_history(rest, false);
    else if (cmd == "/ghistory" && !rest.empty()) ok = client.request_history(rest, true);
    else if ((cmd == "/msg" || cmd == "/group") && split_arg(rest, target, text) && !text.empty()){
      ok = cmd == "/msg" ? client.send_private(target, text) : client.send_group(target, text);
    }
    else if ((cmd == "/file" || cmd == "/gfile") && split_arg(rest, target, text) && !text.empty()){
      if (!client.send_file(target, text, cmd == "/gfile", err)){
        std::lock_guard<std::mutex> lk(g_out_mx);
        std::cout << "[error] " << err << "\n";
      }
    }
    else {
      std::lock_guard<std::mutex> lk(g_out_mx);
      std::cout << "Unknown command. /help for the list.\n";
    }

    if (!ok){
      std::lock_guard<std::mutex> lk(g_out_mx);
      std::cout << "[error] send failed\n";
    }
  }

  client.disconnect();
  return 0;
}
