#ifndef RELAYCHAT_UTIL_UTILS_HPP
#define RELAYCHAT_UTIL_UTILS_HPP

#include <cstdint>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <string>
#include <cerrno>

#ifdef _WIN32
  #include <winsock2.h>
  #include <ws2tcpip.h>
  using socket_t = SOCKET;
  #define CLOSESOCK closesocket
  #define SHUTDOWN_BOTH SD_BOTH
  #define GET_LAST_SOCK_ERR WSAGetLastError()
  #define INVALID_SOCK INVALID_SOCKET
  #define SOCK_ERROR SOCKET_ERROR
#else
  #include <unistd.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <arpa/inet.h>
  using socket_t = int;
  #define CLOSESOCK ::close
  #define SHUTDOWN_BOTH SHUT_RDWR
  #define GET_LAST_SOCK_ERR errno
  #define INVALID_SOCK (-1)
  #define SOCK_ERROR (-1)
#endif

#ifndef MSG_NOSIGNAL
  #define MSG_NOSIGNAL 0
#endif

namespace relaychat {

// ---------- Time ----------
// Local time, "YYYY-MM-DDTHH:MM:SS.uuuuuu". Fixed width, so it sorts lexically.
inline std::string iso_timestamp(){
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t secs = system_clock::to_time_t(now);
  const auto micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &secs);
#else
  localtime_r(&secs, &tm);
#endif
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(micros));
  return buf;
}

// ---------- Socket I/O helpers ----------
inline bool write_exact(socket_t s, const void* buf, size_t n){
  const char* p = static_cast<const char*>(buf);
  size_t sent=0;
  while(sent<n){
    int r = send(s, p+sent, static_cast<int>(n-sent), MSG_NOSIGNAL);
    if (r==SOCK_ERROR) return false;
    sent += static_cast<size_t>(r);
  }
  return true;
}

} // namespace relaychat

#endif
