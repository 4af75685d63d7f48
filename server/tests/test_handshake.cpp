#include <catch2/catch.hpp>

#include "crypto/handshake.hpp"
#include "test_support.hpp"

using namespace relaychat;
using relaychat::testing::shared_server_key;

TEST_CASE("key exchange establishes the same key on both sides", "[handshake]"){
  ServerHandshake server(shared_server_key());
  ClientHandshake client;
  REQUIRE(server.state() == HandshakeState::NoKey);
  REQUIRE(client.state() == HandshakeState::NoKey);

  Envelope offer = server.begin("alice");
  CHECK(server.state() == HandshakeState::AwaitingPeerKey);
  CHECK(offer.type == MessageType::KeyExchange);
  CHECK(offer.sender == "SERVER");
  CHECK(offer.receiver.value() == "alice");
  const auto* kx = std::get_if<KeyExchange>(&offer.data);
  REQUIRE(kx != nullptr);
  CHECK(kx->step == kStepServerPublicKey);
  CHECK_FALSE(kx->public_key.empty());

  // the offer travels as cleartext JSON
  auto wire_offer = decode(encode(offer));
  REQUIRE(wire_offer.has_value());
  Envelope reply = client.on_server_key(*wire_offer, "alice");
  CHECK(client.state() == HandshakeState::AwaitingPeerKey);
  CHECK(std::get<KeyExchange>(reply.data).step == kStepClientSessionKey);

  Envelope ack = server.accept(*decode(encode(reply)));
  CHECK(server.state() == HandshakeState::Established);
  CHECK(std::get<KeyExchange>(ack.data).step == kStepComplete);

  client.on_complete(*decode(encode(ack)));
  CHECK(client.state() == HandshakeState::Established);

  CHECK(client.cipher().decrypt(server.cipher().encrypt("to client")) == "to client");
  CHECK(server.cipher().decrypt(client.cipher().encrypt("to server")) == "to server");
}

TEST_CASE("out-of-order steps are rejected", "[handshake]"){
  ServerHandshake server(shared_server_key());

  SECTION("accept before begin"){
    KeyExchange kx;
    kx.step = kStepClientSessionKey;
    kx.encrypted_session_key = "AAAA";
    CHECK_THROWS_AS(server.accept(make_key_exchange("alice", "SERVER", kx)), HandshakeFailure);
    CHECK(server.state() == HandshakeState::NoKey);
  }

  SECTION("begin twice"){
    server.begin("alice");
    CHECK_THROWS_AS(server.begin("alice"), HandshakeFailure);
  }

  SECTION("client completes without a key"){
    ClientHandshake client;
    KeyExchange done;
    done.step = kStepComplete;
    CHECK_THROWS_AS(client.on_complete(make_key_exchange("SERVER", "alice", done)), HandshakeFailure);
  }
}

TEST_CASE("wrong step tag or missing material is fatal", "[handshake]"){
  ServerHandshake server(shared_server_key());
  ClientHandshake client;
  Envelope offer = server.begin("bob");

  SECTION("server expects client_session_key"){
    KeyExchange wrong;
    wrong.step = kStepComplete;
    CHECK_THROWS_AS(server.accept(make_key_exchange("bob", "SERVER", wrong)), HandshakeFailure);
    CHECK(server.state() != HandshakeState::Established);
  }

  SECTION("no encrypted key"){
    KeyExchange empty;
    empty.step = kStepClientSessionKey;
    CHECK_THROWS_AS(server.accept(make_key_exchange("bob", "SERVER", empty)), HandshakeFailure);
  }

  SECTION("not a key exchange at all"){
    CHECK_THROWS_AS(server.accept(make_private("bob", "SERVER", "hi")), HandshakeFailure);
  }

  SECTION("undecryptable session key"){
    KeyExchange junk;
    junk.step = kStepClientSessionKey;
    junk.encrypted_session_key = crypto::base64_encode(std::vector<uint8_t>(256, 0x11));
    CHECK_THROWS_AS(server.accept(make_key_exchange("bob", "SERVER", junk)), HandshakeFailure);
    CHECK_FALSE(server.cipher().has_key());
  }

  SECTION("client gets a bad public key"){
    KeyExchange bad;
    bad.step = kStepServerPublicKey;
    bad.public_key = "bm90IGEga2V5";
    CHECK_THROWS_AS(client.on_server_key(make_key_exchange("SERVER", "bob", bad), "bob"), HandshakeFailure);
    CHECK(client.state() == HandshakeState::NoKey);
    CHECK_FALSE(client.cipher().has_key());
  }

  SECTION("client gets the wrong step"){
    KeyExchange wrong = std::get<KeyExchange>(offer.data);
    wrong.step = kStepComplete;
    CHECK_THROWS_AS(client.on_server_key(make_key_exchange("SERVER", "bob", wrong), "bob"), HandshakeFailure);
  }
}

TEST_CASE("reset discards the session key", "[handshake]"){
  ServerHandshake server(shared_server_key());
  ClientHandshake client;
  Envelope reply = client.on_server_key(server.begin("carol"), "carol");
  server.accept(reply);
  REQUIRE(server.cipher().has_key());

  server.reset();
  CHECK(server.state() == HandshakeState::NoKey);
  CHECK_FALSE(server.cipher().has_key());
  CHECK_THROWS_AS(server.cipher().encrypt("x"), crypto::NoSessionKey);
}

TEST_CASE("handshake state names", "[handshake]"){
  CHECK(std::string(to_string(HandshakeState::NoKey)) == "NoKey");
  CHECK(std::string(to_string(HandshakeState::AwaitingPeerKey)) == "AwaitingPeerKey");
  CHECK(std::string(to_string(HandshakeState::Established)) == "Established");
}
