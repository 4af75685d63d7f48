#ifndef RELAYCHAT_STORAGE_DB_HPP
#define RELAYCHAT_STORAGE_DB_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace relaychat {

struct UserRecord {
  std::string username;
  std::string registered_at;
  std::string last_seen;
};

struct HistoryMessage {
  int64_t     id = 0;
  std::string sender;
  std::string receiver;
  std::string type;
  std::string text;
  std::string timestamp;
  bool        is_group = false;
  std::string group_name;
};

struct OfflineMessage {
  int64_t     id = 0;
  std::string receiver;
  std::string sender;
  std::string type;
  std::string content;     // serialized envelope, sent as-is on flush
  std::string timestamp;
  bool        delivered = false;
  bool        is_group = false;
  std::string group_name;
};

struct GroupRecord {
  std::string name;
  std::string creator;
  std::string created_at;
};

// SQLite store: users, message_history, offline_messages, groups, group_members.
// Every call is one statement (create_group: two) under an internal lock.
class Db {
public:
  Db() = default;
  ~Db();
  Db(const Db&) = delete;
  Db& operator=(const Db&) = delete;

  bool open(const std::string& path);          // creates the schema if missing
  void close();
  bool is_open() const { return db_ != nullptr; }

  // users
  bool register_user(const std::string& username);   // insert, or refresh last_seen
  bool user_exists(const std::string& username);
  std::vector<UserRecord> all_users();

  // history (append-only)
  bool store_message(const std::string& sender,
                     const std::string& receiver,
                     const std::string& type,
                     const std::string& text,
                     bool is_group = false,
                     const std::string& group_name = std::string());

  // both directions of a private conversation, oldest first
  std::vector<HistoryMessage> conversation_history(const std::string& a,
                                                   const std::string& b,
                                                   std::size_t limit);
  std::vector<HistoryMessage> group_history(const std::string& group, std::size_t limit);

  // offline queue
  bool store_offline(const std::string& receiver,
                     const std::string& sender,
                     const std::string& type,
                     const std::string& content,
                     bool is_group = false,
                     const std::string& group_name = std::string());
  std::vector<OfflineMessage> pending_offline(const std::string& receiver);
  std::size_t pending_count(const std::string& receiver);
  // Marks the receiver's undelivered rows delivered; with up_to_id, only rows up to it.
  bool mark_delivered(const std::string& receiver, std::optional<int64_t> up_to_id = std::nullopt);

  // groups
  bool create_group(const std::string& name, const std::string& creator);  // false if taken
  bool add_group_member(const std::string& name, const std::string& username);
  bool group_exists(const std::string& name);
  std::vector<std::string> group_members(const std::string& name);
  std::vector<GroupRecord> all_groups();

private:
  bool init();

  sqlite3*   db_ = nullptr;
  std::mutex mx_;
};

} // namespace relaychat

#endif
