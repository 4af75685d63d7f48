#include <catch2/catch.hpp>

#include "net/protocol.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

using namespace relaychat;
using relaychat::testing::SocketPair;

TEST_CASE("every message type name maps back to its type", "[protocol]"){
  const MessageType all[] = {
    MessageType::Connect, MessageType::Disconnect, MessageType::Private, MessageType::Group,
    MessageType::File, MessageType::CreateGroup, MessageType::JoinGroup, MessageType::ListUsers,
    MessageType::ListGroups, MessageType::HistoryRequest, MessageType::HistoryResponse,
    MessageType::KeyExchange, MessageType::Success, MessageType::Error, MessageType::Offline,
  };
  for (auto t : all){
    auto back = message_type_from_string(to_string(t));
    REQUIRE(back.has_value());
    CHECK(*back == t);
  }
  CHECK_FALSE(message_type_from_string("ACK").has_value());
  CHECK_FALSE(message_type_from_string("private").has_value());
}

TEST_CASE("private message keeps every field", "[protocol]"){
  Envelope m = make_private("alice", "bob", "hi there");
  auto d = decode(encode(m));
  REQUIRE(d.has_value());
  CHECK(*d == m);
  CHECK(d->receiver.value() == "bob");
  CHECK(d->text.value() == "hi there");
  CHECK(std::holds_alternative<std::monostate>(d->data));
}

TEST_CASE("absent receiver and text stay absent", "[protocol]"){
  Envelope m = make_connect("carol");
  auto d = decode(encode(m));
  REQUIRE(d.has_value());
  CHECK(d->type == MessageType::Connect);
  CHECK(d->sender == "carol");
  CHECK_FALSE(d->receiver.has_value());
  CHECK_FALSE(d->text.has_value());
}

TEST_CASE("structured payloads survive encoding", "[protocol]"){
  SECTION("history response"){
    HistoryReply r;
    r.other_user = "cs101";
    r.is_group = true;
    r.messages.push_back(HistoryEntry{"alice", "cs101", "hello", "2024-01-01T10:00:00.000001", "GROUP"});
    r.messages.push_back(HistoryEntry{"bob", "cs101", "hey", "2024-01-01T10:00:01.000000", "GROUP"});
    Envelope m = make_history_response("bob", r);
    auto d = decode(encode(m));
    REQUIRE(d.has_value());
    CHECK(*d == m);
  }
  SECTION("user and group lists"){
    Envelope users = make_user_list("alice", {UserEntry{"alice", "online"}, UserEntry{"bob", "online"}});
    Envelope groups = make_group_list("alice", {GroupEntry{"cs101", "alice"}});
    CHECK(decode(encode(users)) == users);
    CHECK(decode(encode(groups)) == groups);
  }
  SECTION("history request"){
    Envelope m = make_history_request("bob", "alice", false);
    auto d = decode(encode(m));
    REQUIRE(d.has_value());
    CHECK(*d == m);
    CHECK(d->receiver.value() == "SERVER");
  }
}

TEST_CASE("group file sets the legacy top-level is_group flag", "[protocol]"){
  Envelope m = make_file("alice", "cs101", "notes.txt", "aGVsbG8=", true);
  auto j = nlohmann::json::parse(encode(m));
  CHECK(j["is_group"] == true);
  CHECK(j["data"]["filename"] == "notes.txt");

  // a peer that only sets the outer flag
  const std::string legacy =
    R"({"type":"FILE","sender":"bob","receiver":"cs101","text":null,)"
    R"("data":{"filename":"a.bin","filedata":"AA=="},"is_group":true})";
  auto d = decode(legacy);
  REQUIRE(d.has_value());
  const auto* f = std::get_if<FilePayload>(&d->data);
  REQUIRE(f != nullptr);
  CHECK(f->is_group);
  CHECK(f->filename == "a.bin");
}

TEST_CASE("key exchange only carries the material for its step", "[protocol]"){
  KeyExchange kx;
  kx.step = "complete";
  auto j = nlohmann::json::parse(encode(make_key_exchange("SERVER", "alice", kx)));
  CHECK(j["data"]["step"] == "complete");
  CHECK_FALSE(j["data"].contains("public_key"));
  CHECK_FALSE(j["data"].contains("encrypted_session_key"));
}

TEST_CASE("list requests carry no payload", "[protocol]"){
  auto d = decode(encode(make_list_users("alice")));
  REQUIRE(d.has_value());
  CHECK(d->type == MessageType::ListUsers);
  CHECK(std::holds_alternative<std::monostate>(d->data));
}

TEST_CASE("malformed input is reported, never thrown", "[protocol]"){
  const char* bad[] = {
    "",
    "not json",
    "[1,2,3]",
    R"({"type":"NOPE","sender":"a"})",
    R"({"type":"PRIVATE"})",
    R"({"type":"PRIVATE","sender":"a","receiver":5})",
    R"({"type":"JOIN_GROUP","sender":"a"})",
    R"({"type":"CREATE_GROUP","sender":"a","data":{"name":"x"}})",
    R"({"type":"KEY_EXCHANGE","sender":"a","data":{}})",
    R"({"type":"HISTORY_RESPONSE","sender":"SERVER","data":{"other_user":"b","messages":[{"text":"x"}]}})",
    R"({"type":"FILE","sender":"a","data":{"filename":"x","filedata":"AA==","is_group":"yes"}})",
    "{\"type\":\"PRIVATE\",\"sender\":\"a\"",
  };
  for (const char* s : bad){
    INFO(s);
    CHECK_NOTHROW(decode(s));
    CHECK_FALSE(decode(s).has_value());
  }
}

TEST_CASE("encoded envelopes never contain a raw newline", "[protocol]"){
  std::string enc = encode(make_private("a", "b", "line one\nline two"));
  CHECK(enc.find('\n') == std::string::npos);
  auto d = decode(enc);
  REQUIRE(d.has_value());
  CHECK(d->text.value() == "line one\nline two");
}

TEST_CASE("invalid UTF-8 in user text does not break encoding", "[protocol]"){
  std::string text = "ok \xff\xfe end";
  std::string enc;
  REQUIRE_NOTHROW(enc = encode(make_private("a", "b", text)));
  CHECK(decode(enc).has_value());
}

TEST_CASE("frame reader splits and joins frames", "[protocol][framing]"){
  SocketPair sp;
  FrameReader reader(64);
  std::string frame;

  SECTION("two frames in one write"){
    REQUIRE(write_exact(sp.client_end(), "one\ntwo\n", 8));
    REQUIRE(reader.pump(sp.server_end()) == FrameReader::Status::Ok);
    REQUIRE(reader.pop(frame));
    CHECK(frame == "one");
    REQUIRE(reader.pop(frame));
    CHECK(frame == "two");
    CHECK_FALSE(reader.pop(frame));
  }

  SECTION("one frame across two writes"){
    REQUIRE(send_frame(sp.client_end(), "") );  // empty frames are skipped
    REQUIRE(write_exact(sp.client_end(), "hel", 3));
    REQUIRE(reader.pump(sp.server_end()) == FrameReader::Status::Ok);
    CHECK_FALSE(reader.pop(frame));
    REQUIRE(write_exact(sp.client_end(), "lo\n", 3));
    REQUIRE(reader.pump(sp.server_end()) == FrameReader::Status::Ok);
    REQUIRE(reader.pop(frame));
    CHECK(frame == "hello");
  }

  SECTION("oversized frame is dropped and the stream recovers"){
    std::string big(100, 'x');
    REQUIRE(write_exact(sp.client_end(), big.data(), big.size()));
    bool overflowed = false;
    while (!overflowed){
      auto st = reader.pump(sp.server_end());
      REQUIRE(st != FrameReader::Status::Closed);
      REQUIRE(st != FrameReader::Status::Error);
      overflowed = st == FrameReader::Status::Overflow;
    }
    REQUIRE(write_exact(sp.client_end(), "tail\nnext\n", 10));
    REQUIRE(reader.pump(sp.server_end()) == FrameReader::Status::Ok);
    REQUIRE(reader.pop(frame));
    CHECK(frame == "next");
    CHECK_FALSE(reader.pop(frame));
  }

  SECTION("peer close"){
    sp.close_client();
    CHECK(reader.pump(sp.server_end()) == FrameReader::Status::Closed);
  }
}
