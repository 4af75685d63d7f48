#include "net/protocol.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace relaychat {

using json = nlohmann::json;

const char* const kServerName = "SERVER";

namespace {

struct TypeName { MessageType type; const char* name; };

const TypeName kTypeNames[] = {
  {MessageType::Connect,         "CONNECT"},
  {MessageType::Disconnect,      "DISCONNECT"},
  {MessageType::Private,         "PRIVATE"},
  {MessageType::Group,           "GROUP"},
  {MessageType::File,            "FILE"},
  {MessageType::CreateGroup,     "CREATE_GROUP"},
  {MessageType::JoinGroup,       "JOIN_GROUP"},
  {MessageType::ListUsers,       "LIST_USERS"},
  {MessageType::ListGroups,      "LIST_GROUPS"},
  {MessageType::HistoryRequest,  "HISTORY_REQUEST"},
  {MessageType::HistoryResponse, "HISTORY_RESPONSE"},
  {MessageType::KeyExchange,     "KEY_EXCHANGE"},
  {MessageType::Success,         "SUCCESS"},
  {MessageType::Error,           "ERROR"},
  {MessageType::Offline,         "OFFLINE"},
};

// strict field readers: a present field of the wrong JSON type is malformed
bool get_string(const json& o, const char* key, std::string& out){
  auto it = o.find(key);
  if (it == o.end() || !it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool get_opt_string(const json& o, const char* key, std::optional<std::string>& out){
  auto it = o.find(key);
  if (it == o.end() || it->is_null()){ out.reset(); return true; }
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool get_string_or_empty(const json& o, const char* key, std::string& out){
  auto it = o.find(key);
  if (it == o.end() || it->is_null()){ out.clear(); return true; }
  if (!it->is_string()) return false;
  out = it->get<std::string>();
  return true;
}

bool get_bool(const json& o, const char* key, bool& out){
  auto it = o.find(key);
  if (it == o.end() || it->is_null()) return true;
  if (!it->is_boolean()) return false;
  out = it->get<bool>();
  return true;
}

json history_entry_to_json(const HistoryEntry& e){
  return json{{"sender", e.sender}, {"receiver", e.receiver}, {"text", e.text},
              {"timestamp", e.timestamp}, {"type", e.type}};
}

json payload_to_json(const Payload& p){
  struct Visitor {
    json operator()(const std::monostate&) const { return nullptr; }
    json operator()(const FilePayload& f) const {
      return json{{"filename", f.filename}, {"filedata", f.filedata}, {"is_group", f.is_group}};
    }
    json operator()(const GroupRef& g) const { return json{{"group_name", g.group_name}}; }
    json operator()(const HistoryQuery& q) const {
      return json{{"other_user", q.other_user}, {"is_group", q.is_group}};
    }
    json operator()(const HistoryReply& r) const {
      json msgs = json::array();
      for (const auto& e : r.messages) msgs.push_back(history_entry_to_json(e));
      return json{{"other_user", r.other_user}, {"is_group", r.is_group}, {"messages", std::move(msgs)}};
    }
    json operator()(const UserList& l) const {
      json users = json::array();
      for (const auto& u : l.users) users.push_back(json{{"username", u.username}, {"status", u.status}});
      return json{{"users", std::move(users)}};
    }
    json operator()(const GroupList& l) const {
      json groups = json::array();
      for (const auto& g : l.groups) groups.push_back(json{{"name", g.name}, {"creator", g.creator}});
      return json{{"groups", std::move(groups)}};
    }
    json operator()(const KeyExchange& k) const {
      json o = json::object();
      o["step"] = k.step;
      if (!k.public_key.empty()) o["public_key"] = k.public_key;
      if (!k.encrypted_session_key.empty()) o["encrypted_session_key"] = k.encrypted_session_key;
      return o;
    }
  };
  return std::visit(Visitor{}, p);
}

bool parse_file(const json& env, const json& d, Payload& out){
  if (!d.is_object()) return false;
  FilePayload f;
  if (!get_string(d, "filename", f.filename)) return false;
  if (!get_string(d, "filedata", f.filedata)) return false;
  // older peers put is_group beside the envelope fields
  if (!get_bool(d, "is_group", f.is_group)) return false;
  if (!f.is_group && !get_bool(env, "is_group", f.is_group)) return false;
  out = std::move(f);
  return true;
}

bool parse_group_ref(const json& d, Payload& out){
  if (!d.is_object()) return false;
  GroupRef g;
  if (!get_string(d, "group_name", g.group_name)) return false;
  out = std::move(g);
  return true;
}

bool parse_history_query(const json& d, Payload& out){
  if (!d.is_object()) return false;
  HistoryQuery q;
  if (!get_string(d, "other_user", q.other_user)) return false;
  if (!get_bool(d, "is_group", q.is_group)) return false;
  out = std::move(q);
  return true;
}

bool parse_history_reply(const json& d, Payload& out){
  if (!d.is_object()) return false;
  HistoryReply r;
  if (!get_string(d, "other_user", r.other_user)) return false;
  if (!get_bool(d, "is_group", r.is_group)) return false;
  auto it = d.find("messages");
  if (it == d.end() || !it->is_array()) return false;
  for (const auto& m : *it){
    if (!m.is_object()) return false;
    HistoryEntry e;
    if (!get_string(m, "sender", e.sender)) return false;
    if (!get_string(m, "text", e.text)) return false;
    if (!get_string_or_empty(m, "receiver", e.receiver)) return false;
    if (!get_string_or_empty(m, "timestamp", e.timestamp)) return false;
    if (!get_string_or_empty(m, "type", e.type)) return false;
    r.messages.push_back(std::move(e));
  }
  out = std::move(r);
  return true;
}

// LIST_* requests carry no data; responses carry the list
bool parse_user_list(const json& d, Payload& out){
  if (d.is_null()){ out = std::monostate{}; return true; }
  if (!d.is_object()) return false;
  auto it = d.find("users");
  if (it == d.end() || !it->is_array()) return false;
  UserList l;
  for (const auto& u : *it){
    if (!u.is_object()) return false;
    UserEntry e;
    if (!get_string(u, "username", e.username)) return false;
    if (!get_string_or_empty(u, "status", e.status)) return false;
    l.users.push_back(std::move(e));
  }
  out = std::move(l);
  return true;
}

bool parse_group_list(const json& d, Payload& out){
  if (d.is_null()){ out = std::monostate{}; return true; }
  if (!d.is_object()) return false;
  auto it = d.find("groups");
  if (it == d.end() || !it->is_array()) return false;
  GroupList l;
  for (const auto& g : *it){
    if (!g.is_object()) return false;
    GroupEntry e;
    if (!get_string(g, "name", e.name)) return false;
    if (!get_string_or_empty(g, "creator", e.creator)) return false;
    l.groups.push_back(std::move(e));
  }
  out = std::move(l);
  return true;
}

bool parse_key_exchange(const json& d, Payload& out){
  if (!d.is_object()) return false;
  KeyExchange k;
  if (!get_string(d, "step", k.step)) return false;
  if (!get_string_or_empty(d, "public_key", k.public_key)) return false;
  if (!get_string_or_empty(d, "encrypted_session_key", k.encrypted_session_key)) return false;
  out = std::move(k);
  return true;
}

bool parse_payload(MessageType t, const json& env, Payload& out){
  static const json null_json = nullptr;
  auto it = env.find("data");
  const json& d = (it == env.end()) ? null_json : *it;

  switch (t){
    case MessageType::File:            return parse_file(env, d, out);
    case MessageType::CreateGroup:
    case MessageType::JoinGroup:       return parse_group_ref(d, out);
    case MessageType::HistoryRequest:  return parse_history_query(d, out);
    case MessageType::HistoryResponse: return parse_history_reply(d, out);
    case MessageType::ListUsers:       return parse_user_list(d, out);
    case MessageType::ListGroups:      return parse_group_list(d, out);
    case MessageType::KeyExchange:     return parse_key_exchange(d, out);
    case MessageType::Connect:
    case MessageType::Disconnect:
    case MessageType::Private:
    case MessageType::Group:
    case MessageType::Success:
    case MessageType::Error:
    case MessageType::Offline:
      out = std::monostate{};
      return true;
  }
  return false;
}

Envelope base(MessageType t, const std::string& sender){
  Envelope e;
  e.type = t;
  e.sender = sender;
  return e;
}

} // namespace

const char* to_string(MessageType t){
  for (const auto& tn : kTypeNames) if (tn.type == t) return tn.name;
  return "UNKNOWN";
}

std::optional<MessageType> message_type_from_string(const std::string& s){
  for (const auto& tn : kTypeNames) if (s == tn.name) return tn.type;
  return std::nullopt;
}

bool operator==(const FilePayload& a, const FilePayload& b){
  return a.filename == b.filename && a.filedata == b.filedata && a.is_group == b.is_group;
}
bool operator==(const GroupRef& a, const GroupRef& b){ return a.group_name == b.group_name; }
bool operator==(const HistoryQuery& a, const HistoryQuery& b){
  return a.other_user == b.other_user && a.is_group == b.is_group;
}
bool operator==(const HistoryEntry& a, const HistoryEntry& b){
  return a.sender == b.sender && a.receiver == b.receiver && a.text == b.text &&
         a.timestamp == b.timestamp && a.type == b.type;
}
bool operator==(const HistoryReply& a, const HistoryReply& b){
  return a.other_user == b.other_user && a.is_group == b.is_group && a.messages == b.messages;
}
bool operator==(const UserEntry& a, const UserEntry& b){
  return a.username == b.username && a.status == b.status;
}
bool operator==(const UserList& a, const UserList& b){ return a.users == b.users; }
bool operator==(const GroupEntry& a, const GroupEntry& b){
  return a.name == b.name && a.creator == b.creator;
}
bool operator==(const GroupList& a, const GroupList& b){ return a.groups == b.groups; }
bool operator==(const KeyExchange& a, const KeyExchange& b){
  return a.step == b.step && a.public_key == b.public_key &&
         a.encrypted_session_key == b.encrypted_session_key;
}

bool operator==(const Envelope& a, const Envelope& b){
  return a.type == b.type && a.sender == b.sender && a.receiver == b.receiver &&
         a.text == b.text && a.data == b.data;
}

std::string encode(const Envelope& env){
  json j;
  j["type"] = to_string(env.type);
  j["sender"] = env.sender;
  j["receiver"] = env.receiver ? json(*env.receiver) : json(nullptr);
  j["text"] = env.text ? json(*env.text) : json(nullptr);
  j["data"] = payload_to_json(env.data);
  if (const auto* f = std::get_if<FilePayload>(&env.data)){
    if (f->is_group) j["is_group"] = true;
  }
  // user text is not guaranteed to be valid UTF-8
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Envelope> decode(const std::string& text){
  json j = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  std::string type_name;
  if (!get_string(j, "type", type_name)) return std::nullopt;
  auto type = message_type_from_string(type_name);
  if (!type) return std::nullopt;

  Envelope env;
  env.type = *type;
  if (!get_string(j, "sender", env.sender)) return std::nullopt;
  if (!get_opt_string(j, "receiver", env.receiver)) return std::nullopt;
  if (!get_opt_string(j, "text", env.text)) return std::nullopt;
  if (!parse_payload(env.type, j, env.data)) return std::nullopt;
  return env;
}

Envelope make_connect(const std::string& username){ return base(MessageType::Connect, username); }

Envelope make_disconnect(const std::string& username){ return base(MessageType::Disconnect, username); }

Envelope make_private(const std::string& sender, const std::string& receiver, const std::string& text){
  Envelope e = base(MessageType::Private, sender);
  e.receiver = receiver;
  e.text = text;
  return e;
}

Envelope make_group(const std::string& sender, const std::string& group, const std::string& text){
  Envelope e = base(MessageType::Group, sender);
  e.receiver = group;
  e.text = text;
  return e;
}

Envelope make_file(const std::string& sender, const std::string& target,
                   const std::string& filename, const std::string& filedata_b64, bool is_group){
  Envelope e = base(MessageType::File, sender);
  e.receiver = target;
  e.data = FilePayload{filename, filedata_b64, is_group};
  return e;
}

Envelope make_create_group(const std::string& sender, const std::string& group){
  Envelope e = base(MessageType::CreateGroup, sender);
  e.data = GroupRef{group};
  return e;
}

Envelope make_join_group(const std::string& sender, const std::string& group){
  Envelope e = base(MessageType::JoinGroup, sender);
  e.data = GroupRef{group};
  return e;
}

Envelope make_list_users(const std::string& sender){ return base(MessageType::ListUsers, sender); }

Envelope make_list_groups(const std::string& sender){ return base(MessageType::ListGroups, sender); }

Envelope make_history_request(const std::string& sender, const std::string& other, bool is_group){
  Envelope e = base(MessageType::HistoryRequest, sender);
  e.receiver = std::string(kServerName);
  e.data = HistoryQuery{other, is_group};
  return e;
}

Envelope make_history_response(const std::string& receiver, HistoryReply reply){
  Envelope e = base(MessageType::HistoryResponse, kServerName);
  e.receiver = receiver;
  e.data = std::move(reply);
  return e;
}

Envelope make_user_list(const std::string& receiver, std::vector<UserEntry> users){
  Envelope e = base(MessageType::ListUsers, kServerName);
  e.receiver = receiver;
  e.data = UserList{std::move(users)};
  return e;
}

Envelope make_group_list(const std::string& receiver, std::vector<GroupEntry> groups){
  Envelope e = base(MessageType::ListGroups, kServerName);
  e.receiver = receiver;
  e.data = GroupList{std::move(groups)};
  return e;
}

Envelope make_key_exchange(const std::string& sender, const std::string& receiver, KeyExchange kx){
  Envelope e = base(MessageType::KeyExchange, sender);
  e.receiver = receiver;
  e.data = std::move(kx);
  return e;
}

Envelope make_success(const std::string& text){
  Envelope e = base(MessageType::Success, kServerName);
  e.text = text;
  return e;
}

Envelope make_error(const std::string& text){
  Envelope e = base(MessageType::Error, kServerName);
  e.text = text;
  return e;
}

Envelope make_offline(const std::string& receiver, const std::string& text){
  Envelope e = base(MessageType::Offline, kServerName);
  e.receiver = receiver;
  e.text = text;
  return e;
}

bool send_frame(socket_t s, const std::string& frame){
  std::string wire;
  wire.reserve(frame.size() + 1);
  wire.append(frame);
  wire.push_back('\n');
  return write_exact(s, wire.data(), wire.size());
}

FrameReader::FrameReader(std::size_t max_frame, std::size_t recv_chunk)
  : max_(max_frame), buf_(std::max<std::size_t>(1, std::min(max_frame, recv_chunk))) {}

FrameReader::Status FrameReader::pump(socket_t s){
  int r = recv(s, buf_.data(), static_cast<int>(buf_.size()), 0);
  if (r == 0) return Status::Closed;
  if (r == SOCK_ERROR) return Status::Error;

  bool overflow = false;
  const char* p = buf_.data();
  const std::size_t n = static_cast<std::size_t>(r);
  std::size_t start = 0;
  for (std::size_t i = 0; i < n; ++i){
    if (p[i] != '\n') continue;
    if (discarding_){
      discarding_ = false;
      pending_.clear();
    } else {
      pending_.append(p + start, i - start);
      if (pending_.size() > max_) overflow = true;
      else if (!pending_.empty()) ready_.push_back(std::move(pending_));
      pending_.clear();
    }
    start = i + 1;
  }
  if (!discarding_ && start < n){
    pending_.append(p + start, n - start);
    if (pending_.size() > max_){
      pending_.clear();
      discarding_ = true;
      overflow = true;
    }
  }
  return overflow ? Status::Overflow : Status::Ok;
}

bool FrameReader::pop(std::string& frame){
  if (ready_.empty()) return false;
  frame = std::move(ready_.front());
  ready_.pop_front();
  return true;
}

} // namespace relaychat
