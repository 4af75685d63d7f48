#include "net/readiness.hpp"

#include <iostream>

#ifdef _WIN32
  #include <winsock2.h>
#else
  #include <sys/select.h>
  #include <poll.h>
#endif
#ifdef __linux__
  #include <sys/epoll.h>
#endif

namespace relaychat {

const char* to_string(WaitMethod m){
  switch (m){
    case WaitMethod::Select: return "select";
    case WaitMethod::Poll:   return "poll";
    case WaitMethod::Epoll:  return "epoll";
  }
  return "?";
}

std::optional<WaitMethod> wait_method_from_string(const std::string& s){
  if (s == "select") return WaitMethod::Select;
  if (s == "poll")   return WaitMethod::Poll;
  if (s == "epoll")  return WaitMethod::Epoll;
  return std::nullopt;
}

WaitMethod default_wait_method(){
#ifdef __linux__
  return WaitMethod::Epoll;
#else
  return WaitMethod::Select;
#endif
}

ReadinessWaiter::ReadinessWaiter(socket_t sock, WaitMethod method)
  : sock_(sock), method_(method)
{
#ifdef __linux__
  if (method_ == WaitMethod::Epoll){
    epfd_ = epoll_create1(EPOLL_CLOEXEC);
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = sock_;
    if (epfd_ < 0 || epoll_ctl(epfd_, EPOLL_CTL_ADD, sock_, &ev) != 0){
      std::cerr << "[client] epoll unavailable, using select\n";
      if (epfd_ >= 0){ ::close(epfd_); epfd_ = -1; }
      method_ = WaitMethod::Select;
    }
  }
#else
  if (method_ == WaitMethod::Epoll) method_ = WaitMethod::Select;
#endif
}

ReadinessWaiter::~ReadinessWaiter(){
#ifdef __linux__
  if (epfd_ >= 0) ::close(epfd_);
#endif
}

WaitResult ReadinessWaiter::wait_readable(int timeout_ms){
  if (timeout_ms < 0) timeout_ms = 0;
  switch (method_){
    case WaitMethod::Select: return wait_select(timeout_ms);
    case WaitMethod::Poll:   return wait_poll(timeout_ms);
    case WaitMethod::Epoll:  return wait_epoll(timeout_ms);
  }
  return WaitResult::Error;
}

WaitResult ReadinessWaiter::wait_select(int timeout_ms){
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(sock_, &readfds);
  timeval tv{};
  tv.tv_sec = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
#ifdef _WIN32
  const int rc = select(0, &readfds, nullptr, nullptr, &tv);
#else
  const int rc = select(sock_ + 1, &readfds, nullptr, nullptr, &tv);
#endif
  if (rc < 0) return errno == EINTR ? WaitResult::Timeout : WaitResult::Error;
  if (rc == 0) return WaitResult::Timeout;
  return FD_ISSET(sock_, &readfds) ? WaitResult::Ready : WaitResult::Timeout;
}

WaitResult ReadinessWaiter::wait_poll(int timeout_ms){
#ifdef _WIN32
  WSAPOLLFD p{};
  p.fd = sock_;
  p.events = POLLRDNORM;
  const int rc = WSAPoll(&p, 1, timeout_ms);
#else
  pollfd p{};
  p.fd = sock_;
  p.events = POLLIN;
  const int rc = ::poll(&p, 1, timeout_ms);
#endif
  if (rc < 0) return errno == EINTR ? WaitResult::Timeout : WaitResult::Error;
  if (rc == 0) return WaitResult::Timeout;
  // hang-up / error are "readable": the next recv reports the close
  return WaitResult::Ready;
}

WaitResult ReadinessWaiter::wait_epoll(int timeout_ms){
#ifdef __linux__
  epoll_event ev{};
  const int rc = epoll_wait(epfd_, &ev, 1, timeout_ms);
  if (rc < 0) return errno == EINTR ? WaitResult::Timeout : WaitResult::Error;
  if (rc == 0) return WaitResult::Timeout;
  return WaitResult::Ready;
#else
  return wait_select(timeout_ms);
#endif
}

} // namespace relaychat
