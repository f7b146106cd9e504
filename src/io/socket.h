#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <netinet/in.h>

// Owns one socket descriptor; closed on destruction.
class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket() { reset(); }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;
  Socket(Socket&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
  Socket& operator=(Socket&& o) noexcept;

  int fd() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Wakes up any thread blocked on the descriptor without releasing it.
  void shutdown();
  void reset();

private:
  int fd_{-1};
};

namespace net {

// Parses a dotted IPv4 address; false when it is not one.
bool parse_ipv4(const std::string& host, in_addr& out);

std::string peer_name(const sockaddr_in& addr);

// Writes everything or returns false (errno is preserved). Never raises SIGPIPE.
bool send_all(int fd, std::string_view data);

void set_send_timeout(int fd, std::chrono::milliseconds t);
void set_no_delay(int fd);

} // namespace net
