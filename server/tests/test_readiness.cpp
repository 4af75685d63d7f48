#include <catch2/catch.hpp>

#include "net/readiness.hpp"
#include "test_support.hpp"

using namespace relaychat;
using relaychat::testing::SocketPair;

TEST_CASE("method names", "[readiness]"){
  CHECK(wait_method_from_string("select") == WaitMethod::Select);
  CHECK(wait_method_from_string("poll") == WaitMethod::Poll);
  CHECK(wait_method_from_string("epoll") == WaitMethod::Epoll);
  CHECK_FALSE(wait_method_from_string("kqueue").has_value());
  CHECK(std::string(to_string(WaitMethod::Poll)) == "poll");
}

TEST_CASE("readiness wait reports data, timeouts and close", "[readiness]"){
  auto method = GENERATE(WaitMethod::Select, WaitMethod::Poll, WaitMethod::Epoll);
  INFO(to_string(method));

  SocketPair sp;
  ReadinessWaiter waiter(sp.server_end(), method);
#ifdef __linux__
  CHECK(waiter.method() == method);
#endif

  CHECK(waiter.wait_readable(20) == WaitResult::Timeout);

  REQUIRE(write_exact(sp.client_end(), "x", 1));
  CHECK(waiter.wait_readable(1000) == WaitResult::Ready);
  char c = 0;
  REQUIRE(recv(sp.server_end(), &c, 1, 0) == 1);
  CHECK(waiter.wait_readable(20) == WaitResult::Timeout);

  // a closed peer wakes the waiter so the next recv can see EOF
  sp.close_client();
  CHECK(waiter.wait_readable(1000) == WaitResult::Ready);
}
