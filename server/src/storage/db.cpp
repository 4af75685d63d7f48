#include "storage/db.hpp"
#include "util/utils.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace relaychat {

namespace {

// finalizes on scope exit
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt(){ if (st) sqlite3_finalize(st); }
};

bool prepare(sqlite3* db, const char* sql, Stmt& s){
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK){
    std::cerr << "[db] prepare failed: " << sqlite3_errmsg(db) << "\n";
    return false;
  }
  return true;
}

void bind_text(Stmt& s, int idx, const std::string& v){
  sqlite3_bind_text(s.st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

std::string col_text(Stmt& s, int idx){
  const unsigned char* t = sqlite3_column_text(s.st, idx);
  if (!t) return std::string();
  return std::string(reinterpret_cast<const char*>(t),
                     static_cast<std::size_t>(sqlite3_column_bytes(s.st, idx)));
}

bool step_done(sqlite3* db, Stmt& s){
  int rc = sqlite3_step(s.st);
  if (rc != SQLITE_DONE){
    if (rc != SQLITE_CONSTRAINT)
      std::cerr << "[db] step failed: " << sqlite3_errmsg(db) << "\n";
    return false;
  }
  return true;
}

HistoryMessage read_history_row(Stmt& s){
  HistoryMessage m;
  m.id         = sqlite3_column_int64(s.st, 0);
  m.sender     = col_text(s, 1);
  m.receiver   = col_text(s, 2);
  m.type       = col_text(s, 3);
  m.text       = col_text(s, 4);
  m.timestamp  = col_text(s, 5);
  m.is_group   = sqlite3_column_int(s.st, 6) != 0;
  m.group_name = col_text(s, 7);
  return m;
}

} // namespace

Db::~Db(){ close(); }

bool Db::open(const std::string& path){
  std::lock_guard<std::mutex> lk(mx_);
  if (db_) return true;
  std::filesystem::path p(path);
  if (p.has_parent_path()){
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
  }
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK){
    std::cerr << "[db] cannot open " << path << ": " << sqlite3_errmsg(db_) << "\n";
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 2000);
  if (!init()){
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  return true;
}

void Db::close(){
  std::lock_guard<std::mutex> lk(mx_);
  if (db_){ sqlite3_close(db_); db_ = nullptr; }
}

bool Db::init(){
  const char* sql =
    "CREATE TABLE IF NOT EXISTS users ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  username TEXT UNIQUE NOT NULL,"
    "  registered_at TEXT NOT NULL,"
    "  last_seen TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS message_history ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  sender TEXT NOT NULL,"
    "  receiver TEXT NOT NULL,"
    "  message_type TEXT NOT NULL,"
    "  message_text TEXT NOT NULL,"
    "  timestamp TEXT NOT NULL,"
    "  is_group INTEGER DEFAULT 0,"
    "  group_name TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS offline_messages ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  receiver TEXT NOT NULL,"
    "  sender TEXT NOT NULL,"
    "  message_type TEXT NOT NULL,"
    "  content TEXT NOT NULL,"
    "  timestamp TEXT NOT NULL,"
    "  delivered INTEGER DEFAULT 0,"
    "  is_group INTEGER DEFAULT 0,"
    "  group_name TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS groups ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  group_name TEXT UNIQUE NOT NULL,"
    "  creator TEXT NOT NULL,"
    "  created_at TEXT NOT NULL"
    ");"
    "CREATE TABLE IF NOT EXISTS group_members ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  group_name TEXT NOT NULL,"
    "  username TEXT NOT NULL,"
    "  joined_at TEXT NOT NULL,"
    "  UNIQUE(group_name, username)"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_message_history_users "
    "  ON message_history(sender, receiver, timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_offline_receiver "
    "  ON offline_messages(receiver, delivered);";
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK){
    std::cerr << "[db] schema init failed: " << (err ? err : "?") << "\n";
    sqlite3_free(err);
    return false;
  }
  return true;
}

// ---------- users ----------

bool Db::register_user(const std::string& username){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  const char* sql =
    "INSERT INTO users(username, registered_at, last_seen) VALUES(?,?,?) "
    "ON CONFLICT(username) DO UPDATE SET last_seen = excluded.last_seen;";
  Stmt s;
  if (!prepare(db_, sql, s)) return false;
  const std::string ts = iso_timestamp();
  bind_text(s, 1, username);
  bind_text(s, 2, ts);
  bind_text(s, 3, ts);
  return step_done(db_, s);
}

bool Db::user_exists(const std::string& username){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  Stmt s;
  if (!prepare(db_, "SELECT 1 FROM users WHERE username = ? LIMIT 1;", s)) return false;
  bind_text(s, 1, username);
  return sqlite3_step(s.st) == SQLITE_ROW;
}

std::vector<UserRecord> Db::all_users(){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<UserRecord> out;
  if (!db_) return out;
  Stmt s;
  if (!prepare(db_, "SELECT username, registered_at, last_seen FROM users ORDER BY username;", s))
    return out;
  while (sqlite3_step(s.st) == SQLITE_ROW)
    out.push_back(UserRecord{col_text(s, 0), col_text(s, 1), col_text(s, 2)});
  return out;
}

// ---------- history ----------

bool Db::store_message(const std::string& sender,
                       const std::string& receiver,
                       const std::string& type,
                       const std::string& text,
                       bool is_group,
                       const std::string& group_name){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  const char* sql =
    "INSERT INTO message_history"
    " (sender, receiver, message_type, message_text, timestamp, is_group, group_name)"
    " VALUES(?,?,?,?,?,?,?);";
  Stmt s;
  if (!prepare(db_, sql, s)) return false;
  bind_text(s, 1, sender);
  bind_text(s, 2, receiver);
  bind_text(s, 3, type);
  bind_text(s, 4, text);
  bind_text(s, 5, iso_timestamp());
  sqlite3_bind_int(s.st, 6, is_group ? 1 : 0);
  if (is_group) bind_text(s, 7, group_name);
  else sqlite3_bind_null(s.st, 7);
  return step_done(db_, s);
}

std::vector<HistoryMessage> Db::conversation_history(const std::string& a,
                                                     const std::string& b,
                                                     std::size_t limit){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<HistoryMessage> out;
  if (!db_ || limit == 0) return out;
  const char* sql =
    "SELECT id, sender, receiver, message_type, message_text, timestamp, is_group, group_name "
    "FROM message_history "
    "WHERE is_group = 0 AND ((sender = ? AND receiver = ?) OR (sender = ? AND receiver = ?)) "
    "ORDER BY id DESC LIMIT ?;";
  Stmt s;
  if (!prepare(db_, sql, s)) return out;
  bind_text(s, 1, a);
  bind_text(s, 2, b);
  bind_text(s, 3, b);
  bind_text(s, 4, a);
  sqlite3_bind_int64(s.st, 5, static_cast<sqlite3_int64>(limit));
  while (sqlite3_step(s.st) == SQLITE_ROW) out.push_back(read_history_row(s));
  std::reverse(out.begin(), out.end());
  return out;
}

std::vector<HistoryMessage> Db::group_history(const std::string& group, std::size_t limit){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<HistoryMessage> out;
  if (!db_ || limit == 0) return out;
  const char* sql =
    "SELECT id, sender, receiver, message_type, message_text, timestamp, is_group, group_name "
    "FROM message_history "
    "WHERE is_group = 1 AND group_name = ? "
    "ORDER BY id DESC LIMIT ?;";
  Stmt s;
  if (!prepare(db_, sql, s)) return out;
  bind_text(s, 1, group);
  sqlite3_bind_int64(s.st, 2, static_cast<sqlite3_int64>(limit));
  while (sqlite3_step(s.st) == SQLITE_ROW) out.push_back(read_history_row(s));
  std::reverse(out.begin(), out.end());
  return out;
}

// ---------- offline queue ----------

bool Db::store_offline(const std::string& receiver,
                       const std::string& sender,
                       const std::string& type,
                       const std::string& content,
                       bool is_group,
                       const std::string& group_name){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  const char* sql =
    "INSERT INTO offline_messages"
    " (receiver, sender, message_type, content, timestamp, is_group, group_name)"
    " VALUES(?,?,?,?,?,?,?);";
  Stmt s;
  if (!prepare(db_, sql, s)) return false;
  bind_text(s, 1, receiver);
  bind_text(s, 2, sender);
  bind_text(s, 3, type);
  bind_text(s, 4, content);
  bind_text(s, 5, iso_timestamp());
  sqlite3_bind_int(s.st, 6, is_group ? 1 : 0);
  if (is_group) bind_text(s, 7, group_name);
  else sqlite3_bind_null(s.st, 7);
  return step_done(db_, s);
}

std::vector<OfflineMessage> Db::pending_offline(const std::string& receiver){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<OfflineMessage> out;
  if (!db_) return out;
  const char* sql =
    "SELECT id, receiver, sender, message_type, content, timestamp, delivered, is_group, group_name "
    "FROM offline_messages WHERE receiver = ? AND delivered = 0 "
    "ORDER BY id;";
  Stmt s;
  if (!prepare(db_, sql, s)) return out;
  bind_text(s, 1, receiver);
  while (sqlite3_step(s.st) == SQLITE_ROW){
    OfflineMessage m;
    m.id         = sqlite3_column_int64(s.st, 0);
    m.receiver   = col_text(s, 1);
    m.sender     = col_text(s, 2);
    m.type       = col_text(s, 3);
    m.content    = col_text(s, 4);
    m.timestamp  = col_text(s, 5);
    m.delivered  = sqlite3_column_int(s.st, 6) != 0;
    m.is_group   = sqlite3_column_int(s.st, 7) != 0;
    m.group_name = col_text(s, 8);
    out.push_back(std::move(m));
  }
  return out;
}

std::size_t Db::pending_count(const std::string& receiver){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return 0;
  Stmt s;
  if (!prepare(db_, "SELECT COUNT(*) FROM offline_messages WHERE receiver = ? AND delivered = 0;", s))
    return 0;
  bind_text(s, 1, receiver);
  if (sqlite3_step(s.st) != SQLITE_ROW) return 0;
  return static_cast<std::size_t>(sqlite3_column_int64(s.st, 0));
}

bool Db::mark_delivered(const std::string& receiver, std::optional<int64_t> up_to_id){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  const char* all =
    "UPDATE offline_messages SET delivered = 1 WHERE receiver = ? AND delivered = 0;";
  const char* upto =
    "UPDATE offline_messages SET delivered = 1 WHERE receiver = ? AND delivered = 0 AND id <= ?;";
  Stmt s;
  if (!prepare(db_, up_to_id ? upto : all, s)) return false;
  bind_text(s, 1, receiver);
  if (up_to_id) sqlite3_bind_int64(s.st, 2, static_cast<sqlite3_int64>(*up_to_id));
  return step_done(db_, s);
}

// ---------- groups ----------

bool Db::create_group(const std::string& name, const std::string& creator){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  const std::string ts = iso_timestamp();
  {
    Stmt s;
    if (!prepare(db_, "INSERT INTO groups(group_name, creator, created_at) VALUES(?,?,?);", s))
      return false;
    bind_text(s, 1, name);
    bind_text(s, 2, creator);
    bind_text(s, 3, ts);
    if (!step_done(db_, s)) return false;
  }
  Stmt s;
  if (!prepare(db_, "INSERT OR IGNORE INTO group_members(group_name, username, joined_at) VALUES(?,?,?);", s))
    return false;
  bind_text(s, 1, name);
  bind_text(s, 2, creator);
  bind_text(s, 3, ts);
  return step_done(db_, s);
}

bool Db::add_group_member(const std::string& name, const std::string& username){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  Stmt s;
  if (!prepare(db_, "INSERT OR IGNORE INTO group_members(group_name, username, joined_at) VALUES(?,?,?);", s))
    return false;
  bind_text(s, 1, name);
  bind_text(s, 2, username);
  bind_text(s, 3, iso_timestamp());
  return step_done(db_, s);
}

bool Db::group_exists(const std::string& name){
  std::lock_guard<std::mutex> lk(mx_);
  if (!db_) return false;
  Stmt s;
  if (!prepare(db_, "SELECT 1 FROM groups WHERE group_name = ? LIMIT 1;", s)) return false;
  bind_text(s, 1, name);
  return sqlite3_step(s.st) == SQLITE_ROW;
}

std::vector<std::string> Db::group_members(const std::string& name){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<std::string> out;
  if (!db_) return out;
  Stmt s;
  if (!prepare(db_, "SELECT username FROM group_members WHERE group_name = ? ORDER BY id;", s))
    return out;
  bind_text(s, 1, name);
  while (sqlite3_step(s.st) == SQLITE_ROW) out.push_back(col_text(s, 0));
  return out;
}

std::vector<GroupRecord> Db::all_groups(){
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<GroupRecord> out;
  if (!db_) return out;
  Stmt s;
  if (!prepare(db_, "SELECT group_name, creator, created_at FROM groups ORDER BY id;", s)) return out;
  while (sqlite3_step(s.st) == SQLITE_ROW)
    out.push_back(GroupRecord{col_text(s, 0), col_text(s, 1), col_text(s, 2)});
  return out;
}

} // namespace relaychat
