#ifndef RELAYCHAT_NET_READINESS_HPP
#define RELAYCHAT_NET_READINESS_HPP

#include "util/utils.hpp"

#include <optional>
#include <string>

namespace relaychat {

enum class WaitMethod { Select, Poll, Epoll };
enum class WaitResult { Ready, Timeout, Error };

const char* to_string(WaitMethod m);
std::optional<WaitMethod> wait_method_from_string(const std::string& s);

// Epoll where the platform has it, select otherwise.
WaitMethod default_wait_method();

/**
 * Bounded wait for one socket to become readable. Used by the client receive
 * loop so it can re-check its running flag between waits. Epoll is created
 * lazily; if that fails the waiter silently uses select.
 */
class ReadinessWaiter {
public:
  ReadinessWaiter(socket_t sock, WaitMethod method);
  ~ReadinessWaiter();
  ReadinessWaiter(const ReadinessWaiter&) = delete;
  ReadinessWaiter& operator=(const ReadinessWaiter&) = delete;

  WaitResult wait_readable(int timeout_ms);

  // May differ from the requested method after a fallback.
  WaitMethod method() const { return method_; }

private:
  WaitResult wait_select(int timeout_ms);
  WaitResult wait_poll(int timeout_ms);
  WaitResult wait_epoll(int timeout_ms);

  socket_t   sock_;
  WaitMethod method_;
  int        epfd_ = -1;
};

} // namespace relaychat

#endif
