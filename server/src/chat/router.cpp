#include "chat/router.hpp"

#include <iostream>
#include <thread>

namespace relaychat {

const char* to_string(RouteStatus s){
  switch (s){
    case RouteStatus::Ok:               return "Ok";
    case RouteStatus::Offline:          return "Offline";
    case RouteStatus::UsernameTaken:    return "UsernameTaken";
    case RouteStatus::UnknownRecipient: return "UnknownRecipient";
    case RouteStatus::UnknownGroup:     return "UnknownGroup";
    case RouteStatus::GroupExists:      return "GroupExists";
    case RouteStatus::BadRequest:       return "BadRequest";
  }
  return "?";
}

bool valid_username(const std::string& name){
  if (name.empty() || name == "." || name.find("..") != std::string::npos) return false;
  for (unsigned char c : name){
    if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) return false;
  }
  return true;
}

Router::Router(Db& db, RouterOptions opts)
  : db_(db), opts_(opts) {}

void Router::load_groups(){
  std::lock_guard<std::mutex> lk(mx_);
  for (const auto& g : db_.all_groups()){
    auto& members = groups_[g.name];
    for (auto& m : db_.group_members(g.name)) members.insert(std::move(m));
  }
  if (opts_.verbose)
    std::cout << "[router] loaded " << groups_.size() << " group(s)\n";
}

// ---------- session lifecycle ----------

RouteStatus Router::register_session(const std::shared_ptr<Session>& s, const std::string& username){
  if (!valid_username(username)) return RouteStatus::BadRequest;
  std::lock_guard<std::mutex> lk(mx_);
  if (sessions_.count(username)) return RouteStatus::UsernameTaken;
  s->set_username(username);
  sessions_[username] = Entry{s, false};
  if (!db_.register_user(username))
    std::cerr << "[router] could not persist user '" << username << "'\n";
  std::cout << "[router] '" << username << "' connected\n";
  return RouteStatus::Ok;
}

std::size_t Router::activate_session(const std::shared_ptr<Session>& s){
  std::lock_guard<std::mutex> lk(mx_);
  auto it = sessions_.find(s->username());
  if (it == sessions_.end() || it->second.session != s) return 0;
  it->second.live = true;
  return flush_offline_locked(s->username(), *s);
}

void Router::disconnect(const std::shared_ptr<Session>& s){
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = sessions_.find(s->username());
    if (it == sessions_.end() || it->second.session != s) return;
    sessions_.erase(it);
  }
  s->discard_key();
  std::cout << "[router] '" << s->username() << "' disconnected\n";
}

std::size_t Router::flush_offline_locked(const std::string& username, Session& s){
  auto pending = db_.pending_offline(username);
  if (pending.empty()) return 0;

  std::cout << "[router] sending " << pending.size() << " offline message(s) to '" << username << "'\n";
  if (!s.send(make_offline(username, "You have " + std::to_string(pending.size()) + " offline message(s)")))
    return 0;
  std::this_thread::sleep_for(opts_.notice_delay);

  std::size_t sent = 0;
  for (std::size_t i = 0; i < pending.size(); ++i){
    if (!s.send_serialized(pending[i].content)){
      std::cerr << "[router] offline message " << (i + 1) << " to '" << username << "' failed\n";
      break;
    }
    ++sent;
    if (i + 1 < pending.size()) std::this_thread::sleep_for(opts_.pacing);
  }
  // rows past the failure stay queued for the next connect
  if (sent) db_.mark_delivered(username, pending[sent - 1].id);
  return sent;
}

// ---------- dispatch ----------

bool Router::dispatch(const std::shared_ptr<Session>& s, Envelope env){
  const std::string me = s->username();
  env.sender = me;

  switch (env.type){
    case MessageType::Disconnect:
      return false;

    case MessageType::Private:
      if (!env.receiver || env.receiver->empty() || !env.text){
        std::lock_guard<std::mutex> lk(mx_);
        reply_locked(me, make_error("PRIVATE needs a receiver and text"));
        break;
      }
      route_private(me, *env.receiver, *env.text);
      break;

    case MessageType::Group:
      if (!env.receiver || env.receiver->empty() || !env.text){
        std::lock_guard<std::mutex> lk(mx_);
        reply_locked(me, make_error("GROUP needs a group name and text"));
        break;
      }
      route_group(me, *env.receiver, *env.text);
      break;

    case MessageType::File: {
      const auto* f = std::get_if<FilePayload>(&env.data);
      if (!f || !env.receiver || env.receiver->empty()){
        std::lock_guard<std::mutex> lk(mx_);
        reply_locked(me, make_error("FILE needs a receiver and file data"));
        break;
      }
      route_file(me, *env.receiver, *f);
      break;
    }

    case MessageType::CreateGroup:
      if (const auto* g = std::get_if<GroupRef>(&env.data)) create_group(g->group_name, me);
      break;

    case MessageType::JoinGroup:
      if (const auto* g = std::get_if<GroupRef>(&env.data)) join_group(g->group_name, me);
      break;

    case MessageType::ListUsers: {
      auto users = list_users();
      s->send(make_user_list(me, std::move(users)));
      break;
    }

    case MessageType::ListGroups: {
      auto groups = list_groups();
      s->send(make_group_list(me, std::move(groups)));
      break;
    }

    case MessageType::HistoryRequest: {
      const auto* q = std::get_if<HistoryQuery>(&env.data);
      if (!q) break;
      auto reply = history(me, q->other_user, q->is_group);
      if (opts_.verbose)
        std::cout << "[router] history for '" << me << "' / '" << q->other_user << "': "
                  << reply.messages.size() << " message(s)\n";
      s->send(make_history_response(me, std::move(reply)));
      break;
    }

    case MessageType::Connect:
      s->send(make_error("Already connected as '" + me + "'"));
      break;

    case MessageType::KeyExchange:
      s->send(make_error("Key exchange already complete"));
      break;

    case MessageType::HistoryResponse:
    case MessageType::Success:
    case MessageType::Error:
    case MessageType::Offline:
      s->send(make_error(std::string("Unexpected message type ") + to_string(env.type)));
      break;
  }
  return true;
}

// ---------- routing ----------

bool Router::deliver_locked(const std::string& username, const std::string& json_text){
  auto it = sessions_.find(username);
  if (it == sessions_.end() || !it->second.live) return false;
  if (it->second.session->send_serialized(json_text)) return true;

  std::cerr << "[router] delivery to '" << username << "' failed, dropping connection\n";
  it->second.session->mark_dead();
  it->second.live = false;
  return false;
}

void Router::reply_locked(const std::string& username, const Envelope& env){
  if (!deliver_locked(username, encode(env)) && opts_.verbose)
    std::cout << "[router] reply to '" << username << "' not sent\n";
}

// Groups created after load_groups (another server on the same store) are picked up here.
bool Router::known_group_locked(const std::string& group){
  if (groups_.count(group)) return true;
  if (!db_.group_exists(group)) return false;
  auto& members = groups_[group];
  for (auto& m : db_.group_members(group)) members.insert(std::move(m));
  return true;
}

std::set<std::string> Router::members_locked(const std::string& group){
  std::set<std::string> out;
  auto it = groups_.find(group);
  if (it != groups_.end()) out = it->second;
  for (auto& m : db_.group_members(group)) out.insert(std::move(m));
  return out;
}

RouteStatus Router::route_private(const std::string& sender, const std::string& receiver, const std::string& text){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_.user_exists(receiver)){
    reply_locked(sender, make_error("User '" + receiver + "' does not exist. Cannot send message."));
    return RouteStatus::UnknownRecipient;
  }

  db_.store_message(sender, receiver, to_string(MessageType::Private), text);

  const std::string payload = encode(make_private(sender, receiver, text));
  if (deliver_locked(receiver, payload)){
    reply_locked(sender, make_success("Message delivered to " + receiver));
    return RouteStatus::Ok;
  }

  db_.store_offline(receiver, sender, to_string(MessageType::Private), payload);
  reply_locked(sender, make_offline(sender, "'" + receiver + "' is offline. Message will be delivered when they connect."));
  return RouteStatus::Offline;
}

RouteStatus Router::route_group(const std::string& sender, const std::string& group, const std::string& text){
  std::lock_guard<std::mutex> lk(mx_);
  if (!known_group_locked(group)){
    reply_locked(sender, make_error("Group '" + group + "' does not exist"));
    return RouteStatus::UnknownGroup;
  }

  const std::string type = to_string(MessageType::Group);
  db_.store_message(sender, group, type, text, true, group);

  const std::string payload = encode(make_group(sender, group, text));
  std::size_t delivered = 0, queued = 0;
  for (const auto& member : members_locked(group)){
    if (member == sender) continue;
    if (deliver_locked(member, payload)){
      ++delivered;
    } else if (db_.user_exists(member)){
      db_.store_offline(member, sender, type, payload, true, group);
      ++queued;
    }
  }

  if (opts_.verbose)
    std::cout << "[router] group '" << group << "': " << delivered << " online, " << queued << " offline\n";
  reply_locked(sender, make_success("Message sent to group '" + group + "' (" +
                                    std::to_string(delivered) + " online, " +
                                    std::to_string(queued) + " offline)"));
  return RouteStatus::Ok;
}

RouteStatus Router::route_file(const std::string& sender, const std::string& target, const FilePayload& file){
  std::lock_guard<std::mutex> lk(mx_);
  const std::string payload = encode(make_file(sender, target, file.filename, file.filedata, file.is_group));

  std::size_t delivered = 0;
  if (file.is_group){
    if (!known_group_locked(target)){
      reply_locked(sender, make_error("Group '" + target + "' does not exist"));
      return RouteStatus::UnknownGroup;
    }
    for (const auto& member : members_locked(target)){
      if (member != sender && deliver_locked(member, payload)) ++delivered;
    }
  } else {
    if (!sessions_.count(target) && !db_.user_exists(target)){
      reply_locked(sender, make_error("User '" + target + "' does not exist. Cannot send file."));
      return RouteStatus::UnknownRecipient;
    }
    if (deliver_locked(target, payload)) ++delivered;
  }

  // files are live-only: never stored, never queued
  if (delivered){
    reply_locked(sender, make_success("File '" + file.filename + "' sent to " + target));
    return RouteStatus::Ok;
  }
  reply_locked(sender, make_offline(sender, "No one online in '" + target + "' to receive '" + file.filename + "'"));
  return RouteStatus::Offline;
}

RouteStatus Router::create_group(const std::string& name, const std::string& creator){
  std::lock_guard<std::mutex> lk(mx_);
  if (name.empty()){
    reply_locked(creator, make_error("Group name must not be empty"));
    return RouteStatus::BadRequest;
  }
  if (groups_.count(name) || !db_.create_group(name, creator)){
    reply_locked(creator, make_error("Group '" + name + "' already exists"));
    return RouteStatus::GroupExists;
  }
  groups_[name] = {creator};
  std::cout << "[router] group '" << name << "' created by '" << creator << "'\n";
  reply_locked(creator, make_success("Group '" + name + "' created successfully"));
  return RouteStatus::Ok;
}

RouteStatus Router::join_group(const std::string& name, const std::string& username){
  std::lock_guard<std::mutex> lk(mx_);
  if (!known_group_locked(name)){
    reply_locked(username, make_error("Group '" + name + "' does not exist"));
    return RouteStatus::UnknownGroup;
  }
  groups_[name].insert(username);
  db_.add_group_member(name, username);
  if (opts_.verbose)
    std::cout << "[router] '" << username << "' joined group '" << name << "'\n";
  reply_locked(username, make_success("Joined group '" + name + "'"));
  return RouteStatus::Ok;
}

// ---------- queries ----------

std::vector<UserEntry> Router::list_users(){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<UserEntry> out;
  for (const auto& kv : sessions_)
    if (kv.second.live) out.push_back(UserEntry{kv.first, "online"});
  return out;
}

std::vector<GroupEntry> Router::list_groups(){
  std::vector<GroupEntry> out;
  for (const auto& g : db_.all_groups()) out.push_back(GroupEntry{g.name, g.creator});
  return out;
}

HistoryReply Router::history(const std::string& requester, const std::string& peer, bool is_group){
  HistoryReply reply;
  reply.other_user = peer;
  reply.is_group = is_group;
  auto rows = is_group ? db_.group_history(peer, opts_.history_limit)
                       : db_.conversation_history(requester, peer, opts_.history_limit);
  for (const auto& r : rows)
    reply.messages.push_back(HistoryEntry{r.sender, r.receiver, r.text, r.timestamp, r.type});
  return reply;
}

bool Router::is_live(const std::string& username){
  std::lock_guard<std::mutex> lk(mx_);
  auto it = sessions_.find(username);
  return it != sessions_.end() && it->second.live;
}

std::size_t Router::live_count(){
  std::lock_guard<std::mutex> lk(mx_);
  std::size_t n = 0;
  for (const auto& kv : sessions_) if (kv.second.live) ++n;
  return n;
}

void Router::close_all(){
  std::lock_guard<std::mutex> lk(mx_);
  for (auto& kv : sessions_) kv.second.session->mark_dead();
}

} // namespace relaychat
