#ifndef RELAYCHAT_CHAT_ROUTER_HPP
#define RELAYCHAT_CHAT_ROUTER_HPP

#include "net/protocol.hpp"
#include "net/session.hpp"
#include "storage/db.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace relaychat {

enum class RouteStatus {
  Ok,
  Offline,           // accepted, queued (or, for files, nobody live to receive it)
  UsernameTaken,
  UnknownRecipient,
  UnknownGroup,
  GroupExists,
  BadRequest,
};

const char* to_string(RouteStatus s);

// Non-empty, no path separators, no "..", no control characters.
bool valid_username(const std::string& name);

struct RouterOptions {
  std::size_t history_limit = 20;
  std::chrono::milliseconds notice_delay{100};   // after the "you have N offline" notice
  std::chrono::milliseconds pacing{200};         // between queued messages
  bool verbose = false;
};

/**
 * Owns the live-user and group registries. Every read-decide-act sequence
 * (is the recipient live -> deliver or enqueue) runs under one mutex, so a
 * concurrent connect/disconnect can't slip in between. Store calls happen
 * with the mutex held.
 */
class Router {
public:
  Router(Db& db, RouterOptions opts);

  // Groups persisted by earlier runs.
  void load_groups();

  // Reserves the name (pending until activate) and persists the user.
  RouteStatus register_session(const std::shared_ptr<Session>& s, const std::string& username);
  // Handshake done: mark live and flush the offline queue. Returns messages delivered.
  std::size_t activate_session(const std::shared_ptr<Session>& s);
  // No-op unless the registry entry is this very session.
  void disconnect(const std::shared_ptr<Session>& s);

  // Handles one decrypted envelope. false = the client asked to disconnect.
  bool dispatch(const std::shared_ptr<Session>& s, Envelope env);

  RouteStatus route_private(const std::string& sender, const std::string& receiver, const std::string& text);
  RouteStatus route_group(const std::string& sender, const std::string& group, const std::string& text);
  RouteStatus route_file(const std::string& sender, const std::string& target, const FilePayload& file);
  RouteStatus create_group(const std::string& name, const std::string& creator);
  RouteStatus join_group(const std::string& name, const std::string& username);

  std::vector<UserEntry>  list_users();
  std::vector<GroupEntry> list_groups();
  HistoryReply history(const std::string& requester, const std::string& peer, bool is_group);

  bool is_live(const std::string& username);
  std::size_t live_count();

  // Server shutdown: wake every connection handler.
  void close_all();

private:
  struct Entry {
    std::shared_ptr<Session> session;
    bool live = false;
  };

  bool deliver_locked(const std::string& username, const std::string& json_text);
  void reply_locked(const std::string& username, const Envelope& env);
  bool known_group_locked(const std::string& group);
  std::set<std::string> members_locked(const std::string& group);
  std::size_t flush_offline_locked(const std::string& username, Session& s);

  Db&           db_;
  RouterOptions opts_;

  std::mutex mx_;
  std::map<std::string, Entry>                 sessions_;
  std::map<std::string, std::set<std::string>> groups_;
};

} // namespace relaychat

#endif
