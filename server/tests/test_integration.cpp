#include <catch2/catch.hpp>

#include "client/client.hpp"
#include "net/server.hpp"
#include "test_support.hpp"

#include <filesystem>

using namespace relaychat;
using namespace relaychat::testing;

namespace {

struct LiveServer {
  TempDir dir;
  ServerConfig cfg;
  std::unique_ptr<Server> server;

  LiveServer(){
    cfg.bind_addr = "127.0.0.1";
    cfg.port = 0;
    cfg.data_dir = dir.path().string();
    cfg.notice_delay_ms = 1;
    cfg.pacing_ms = 1;
    REQUIRE(shared_server_key().save_pem_file(cfg.key_path()));
    server = std::make_unique<Server>(cfg);
    REQUIRE(server->start());
    REQUIRE(server->port() != 0);
  }
  ~LiveServer(){ server->stop(); }
};

struct TestClient {
  Inbox inbox;
  std::unique_ptr<ChatClient> client;

  TestClient(uint16_t port, const std::string& name){
    ClientConfig cfg;
    cfg.host = "127.0.0.1";
    cfg.port = port;
    cfg.username = name;
    cfg.wait_timeout_ms = 50;
    client = std::make_unique<ChatClient>(cfg);
    client->set_handler([this](const Envelope& e){ inbox.push(e); });
  }
  ~TestClient(){ client->disconnect(); }

  bool connect(std::string& err){ return client->connect(err); }
  ChatClient* operator->(){ return client.get(); }
};

std::unique_ptr<TestClient> online(LiveServer& ls, const std::string& name){
  auto c = std::make_unique<TestClient>(ls.server->port(), name);
  std::string err;
  REQUIRE(c->connect(err));
  REQUIRE(eventually([&]{ return ls.server->router().is_live(name); }));
  return c;
}

// A bare TCP connection that speaks the wire format by hand.
struct RawConnection {
  socket_t    sock = INVALID_SOCK;
  FrameReader reader{1u << 20};

  ~RawConnection(){ if (sock != INVALID_SOCK) CLOSESOCK(sock); }

  bool open(uint16_t port){
    sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == INVALID_SOCK) return false;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    return ::connect(sock, (sockaddr*)&addr, sizeof(addr)) != SOCK_ERROR;
  }

  bool send(const std::string& frame){ return send_frame(sock, frame); }

  // Next frame; nullopt on timeout or when the server hangs up.
  std::optional<std::string> frame(int timeout_ms = 2000){
    ReadinessWaiter waiter(sock, WaitMethod::Poll);
    std::string f;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!reader.pop(f)){
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0) return std::nullopt;
      if (waiter.wait_readable(static_cast<int>(left)) != WaitResult::Ready) continue;
      if (reader.pump(sock) != FrameReader::Status::Ok) return std::nullopt;
    }
    return f;
  }

  std::optional<Envelope> plain(int timeout_ms = 2000){
    auto f = frame(timeout_ms);
    if (!f) return std::nullopt;
    return decode(*f);
  }

  // True once recv() reports the server closed the connection.
  bool closed_by_server(int timeout_ms = 2000){
    ReadinessWaiter waiter(sock, WaitMethod::Poll);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline){
      if (waiter.wait_readable(50) != WaitResult::Ready) continue;
      auto st = reader.pump(sock);
      if (st == FrameReader::Status::Closed || st == FrameReader::Status::Error) return true;
    }
    return false;
  }
};

} // namespace

TEST_CASE_METHOD(LiveServer, "two users chat privately and in a group", "[integration]"){
  auto alice = online(*this, "alice");
  auto bob = online(*this, "bob");
  CHECK((*alice)->handshake_state() == HandshakeState::Established);

  REQUIRE((*alice)->create_group("cs101"));
  auto created = alice->inbox.take_type(MessageType::Success);
  REQUIRE(created);
  CHECK(created->text.value() == "Group 'cs101' created successfully");

  REQUIRE((*bob)->join_group("cs101"));
  REQUIRE(bob->inbox.take_type(MessageType::Success));

  REQUIRE((*alice)->send_group("cs101", "hello class"));
  auto got = bob->inbox.take_type(MessageType::Group);
  REQUIRE(got);
  CHECK(got->sender == "alice");
  CHECK(got->text.value() == "hello class");
  REQUIRE(alice->inbox.take_type(MessageType::Success));

  REQUIRE((*bob)->send_private("alice", "hi alice"));
  auto dm = alice->inbox.take_type(MessageType::Private);
  REQUIRE(dm);
  CHECK(dm->sender == "bob");
  REQUIRE(bob->inbox.take_type(MessageType::Success));

  REQUIRE((*bob)->request_history("cs101", true));
  auto gh = bob->inbox.take_type(MessageType::HistoryResponse);
  REQUIRE(gh);
  const auto& greply = std::get<HistoryReply>(gh->data);
  CHECK(greply.is_group);
  REQUIRE(greply.messages.size() == 1);
  CHECK(greply.messages[0].text == "hello class");

  REQUIRE((*alice)->request_history("bob", false));
  auto ph = alice->inbox.take_type(MessageType::HistoryResponse);
  REQUIRE(ph);
  REQUIRE(std::get<HistoryReply>(ph->data).messages.size() == 1);
  CHECK(std::get<HistoryReply>(ph->data).messages[0].sender == "bob");

  REQUIRE((*alice)->request_users());
  auto users = alice->inbox.take_type(MessageType::ListUsers);
  REQUIRE(users);
  CHECK(std::get<UserList>(users->data).users.size() == 2);

  REQUIRE((*alice)->request_groups());
  auto groups = alice->inbox.take_type(MessageType::ListGroups);
  REQUIRE(groups);
  REQUIRE(std::get<GroupList>(groups->data).groups.size() == 1);
  CHECK(std::get<GroupList>(groups->data).groups[0].creator == "alice");
}

TEST_CASE_METHOD(LiveServer, "messages to unknown users are refused and not stored", "[integration]"){
  auto carol = online(*this, "carol");
  REQUIRE((*carol)->send_private("dave", "hello?"));
  auto err = carol->inbox.take_type(MessageType::Error);
  REQUIRE(err);
  CHECK(err->text.value() == "User 'dave' does not exist. Cannot send message.");
  CHECK(server->db().conversation_history("carol", "dave", 20).empty());
  CHECK(server->db().pending_count("dave") == 0);
}

TEST_CASE_METHOD(LiveServer, "a live username cannot be taken twice", "[integration]"){
  auto alice = online(*this, "alice");

  TestClient imposter(server->port(), "alice");
  std::string err;
  CHECK_FALSE(imposter.connect(err));
  CHECK(err == "Username 'alice' is already taken");

  // the first connection is untouched
  CHECK(server->router().is_live("alice"));
  REQUIRE((*alice)->request_users());
  REQUIRE(alice->inbox.take_type(MessageType::ListUsers));
}

TEST_CASE_METHOD(LiveServer, "offline messages arrive on reconnect", "[integration]"){
  auto alice = online(*this, "alice");
  {
    auto bob = online(*this, "bob");
    (*bob)->disconnect();
  }
  REQUIRE(eventually([&]{ return !server->router().is_live("bob"); }));

  REQUIRE((*alice)->send_private("bob", "while you were out"));
  auto queued = alice->inbox.take_type(MessageType::Offline);
  REQUIRE(queued);
  CHECK(queued->text->find("offline") != std::string::npos);
  CHECK(server->db().pending_count("bob") == 1);

  auto bob = online(*this, "bob");
  auto notice = bob->inbox.take_type(MessageType::Offline);
  REQUIRE(notice);
  CHECK(notice->text.value() == "You have 1 offline message(s)");
  auto msg = bob->inbox.take_type(MessageType::Private);
  REQUIRE(msg);
  CHECK(msg->sender == "alice");
  CHECK(msg->text.value() == "while you were out");
  CHECK(eventually([&]{ return server->db().pending_count("bob") == 0; }));
}

TEST_CASE_METHOD(LiveServer, "files go to live recipients only", "[integration]"){
  auto alice = online(*this, "alice");
  auto bob = online(*this, "bob");
  std::string err;

  REQUIRE((*alice)->send_file_bytes("bob", "notes.txt", "line one\nline two\n", false, err));
  auto f = bob->inbox.take_type(MessageType::File);
  REQUIRE(f);
  const auto& payload = std::get<FilePayload>(f->data);
  CHECK(payload.filename == "notes.txt");
  auto bytes = crypto::base64_decode(payload.filedata);
  REQUIRE(bytes);
  CHECK(std::string(bytes->begin(), bytes->end()) == "line one\nline two\n");

  std::string too_big(11u * 1024 * 1024, 'x');
  CHECK_FALSE((*alice)->send_file_bytes("bob", "big.bin", too_big, false, err));
  CHECK_FALSE(err.empty());
}

TEST_CASE_METHOD(LiveServer, "undecryptable and malformed frames are dropped without closing", "[integration]"){
  RawConnection raw;
  REQUIRE(raw.open(server->port()));
  REQUIRE(raw.send(encode(make_connect("mallet"))));
  auto welcome = raw.plain();
  REQUIRE(welcome);
  CHECK(welcome->type == MessageType::Success);
  auto offer = raw.plain();
  REQUIRE(offer);

  ClientHandshake hs;
  REQUIRE(raw.send(encode(hs.on_server_key(*offer, "mallet"))));
  auto ack = raw.plain();
  REQUIRE(ack);
  hs.on_complete(*ack);
  REQUIRE(eventually([&]{ return server->router().is_live("mallet"); }));

  REQUIRE(raw.send("not base64!!"));
  REQUIRE(raw.send(hs.cipher().encrypt("this is not json")));
  REQUIRE(raw.send(hs.cipher().encrypt(encode(make_list_users("mallet")))));

  std::optional<Envelope> reply;
  for (int i = 0; i < 5 && !(reply && reply->type == MessageType::ListUsers); ++i){
    auto f = raw.frame();
    REQUIRE(f);
    reply = decode(hs.cipher().decrypt(*f));
  }
  REQUIRE(reply);
  CHECK(reply->type == MessageType::ListUsers);
  CHECK(server->router().is_live("mallet"));
}

TEST_CASE_METHOD(LiveServer, "a key exchange step out of order closes the connection", "[integration]"){
  RawConnection raw;
  REQUIRE(raw.open(server->port()));
  REQUIRE(raw.send(encode(make_connect("trent"))));
  REQUIRE(raw.plain());  // welcome
  auto offer = raw.plain();
  REQUIRE(offer);
  CHECK(offer->type == MessageType::KeyExchange);

  KeyExchange early;
  early.step = kStepComplete;
  REQUIRE(raw.send(encode(make_key_exchange("trent", "server", early))));
  CHECK(raw.closed_by_server());

  // the name is released and can log in properly
  REQUIRE(eventually([&]{ return !server->router().is_live("trent"); }));
  auto trent = online(*this, "trent");
  CHECK((*trent)->handshake_state() == HandshakeState::Established);
}

TEST_CASE_METHOD(LiveServer, "path-like usernames are refused at connect", "[integration]"){
  TestClient sneaky(server->port(), "../x");
  std::string err;
  CHECK_FALSE(sneaky.connect(err));
  CHECK(err == "Invalid username '../x'");
  CHECK_FALSE(server->db().user_exists("../x"));
}

TEST_CASE("received attachments stay inside the download directory", "[client]"){
  namespace fs = std::filesystem;
  CHECK(attachment_path("downloads", "bob", "notes.txt") == (fs::path("downloads") / "bob_notes.txt").string());
  CHECK(attachment_path("downloads", "../../x", "../evil.txt") == (fs::path("downloads") / "x_evil.txt").string());
  CHECK(attachment_path("downloads", "/etc", "/etc/passwd") == (fs::path("downloads") / "etc_passwd").string());
  CHECK(attachment_path("downloads", "..", "..") == (fs::path("downloads") / "unknown_file").string());
  CHECK(attachment_path("downloads", "", "") == (fs::path("downloads") / "unknown_file").string());
}
