#ifndef RELAYCHAT_NET_PROTOCOL_HPP
#define RELAYCHAT_NET_PROTOCOL_HPP

#include "util/utils.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace relaychat {

// Wire unit: one JSON object {type, sender, receiver, text, data}, one per line.
enum class MessageType {
  Connect,
  Disconnect,
  Private,
  Group,
  File,
  CreateGroup,
  JoinGroup,
  ListUsers,
  ListGroups,
  HistoryRequest,
  HistoryResponse,
  KeyExchange,
  Success,
  Error,
  Offline
};

const char* to_string(MessageType t);
std::optional<MessageType> message_type_from_string(const std::string& s);

extern const char* const kServerName;

// ---------- typed payloads (the "data" field) ----------
struct FilePayload {
  std::string filename;
  std::string filedata;   // base64 of the file contents
  bool        is_group = false;
};

struct GroupRef {
  std::string group_name;
};

struct HistoryQuery {
  std::string other_user;
  bool        is_group = false;
};

struct HistoryEntry {
  std::string sender;
  std::string receiver;
  std::string text;
  std::string timestamp;
  std::string type;
};

struct HistoryReply {
  std::string other_user;
  bool        is_group = false;
  std::vector<HistoryEntry> messages;
};

struct UserEntry {
  std::string username;
  std::string status;
};

struct UserList {
  std::vector<UserEntry> users;
};

struct GroupEntry {
  std::string name;
  std::string creator;
};

struct GroupList {
  std::vector<GroupEntry> groups;
};

struct KeyExchange {
  std::string step;
  std::string public_key;             // server_public_key step
  std::string encrypted_session_key;  // client_session_key step
};

bool operator==(const FilePayload& a, const FilePayload& b);
bool operator==(const GroupRef& a, const GroupRef& b);
bool operator==(const HistoryQuery& a, const HistoryQuery& b);
bool operator==(const HistoryEntry& a, const HistoryEntry& b);
bool operator==(const HistoryReply& a, const HistoryReply& b);
bool operator==(const UserEntry& a, const UserEntry& b);
bool operator==(const UserList& a, const UserList& b);
bool operator==(const GroupEntry& a, const GroupEntry& b);
bool operator==(const GroupList& a, const GroupList& b);
bool operator==(const KeyExchange& a, const KeyExchange& b);

using Payload = std::variant<std::monostate,
                             FilePayload,
                             GroupRef,
                             HistoryQuery,
                             HistoryReply,
                             UserList,
                             GroupList,
                             KeyExchange>;

struct Envelope {
  MessageType                type = MessageType::Error;
  std::string                sender;
  std::optional<std::string> receiver;
  std::optional<std::string> text;
  Payload                    data;
};

bool operator==(const Envelope& a, const Envelope& b);
inline bool operator!=(const Envelope& a, const Envelope& b){ return !(a == b); }

std::string encode(const Envelope& env);
// std::nullopt means the input is not a well-formed envelope.
std::optional<Envelope> decode(const std::string& text);

// ---------- constructors ----------
Envelope make_connect(const std::string& username);
Envelope make_disconnect(const std::string& username);
Envelope make_private(const std::string& sender, const std::string& receiver, const std::string& text);
Envelope make_group(const std::string& sender, const std::string& group, const std::string& text);
Envelope make_file(const std::string& sender, const std::string& target,
                   const std::string& filename, const std::string& filedata_b64, bool is_group);
Envelope make_create_group(const std::string& sender, const std::string& group);
Envelope make_join_group(const std::string& sender, const std::string& group);
Envelope make_list_users(const std::string& sender);
Envelope make_list_groups(const std::string& sender);
Envelope make_history_request(const std::string& sender, const std::string& other, bool is_group);
Envelope make_history_response(const std::string& receiver, HistoryReply reply);
Envelope make_user_list(const std::string& receiver, std::vector<UserEntry> users);
Envelope make_group_list(const std::string& receiver, std::vector<GroupEntry> groups);
Envelope make_key_exchange(const std::string& sender, const std::string& receiver, KeyExchange kx);
Envelope make_success(const std::string& text);
Envelope make_error(const std::string& text);
Envelope make_offline(const std::string& receiver, const std::string& text);

// ---------- framing ----------
// One send call per frame, '\n'-terminated.
bool send_frame(socket_t s, const std::string& frame);

class FrameReader {
public:
  enum class Status { Ok, Closed, Error, Overflow };

  // recv_chunk: bytes requested per recv() call (the receive buffer size).
  explicit FrameReader(std::size_t max_frame, std::size_t recv_chunk = 131072);

  // One recv() call; every complete frame is queued.
  Status pump(socket_t s);

  bool pop(std::string& frame);

private:
  std::size_t             max_;
  std::string             pending_;
  bool                    discarding_ = false;
  std::deque<std::string> ready_;
  std::vector<char>       buf_;
};

} // namespace relaychat

#endif
