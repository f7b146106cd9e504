#include "frame_client.h"
#include "core/errors.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>

FrameClient::FrameClient(const NetworkConfig& cfg) : cfg_(cfg) {}

FrameClient::~FrameClient() {
  close();
}

Handshake FrameClient::connect(const std::string& host, int port) {
  close();

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (!net::parse_ipv4(host, addr.sin_addr)) {
    throw ConnectionLost("invalid sensor address " + host);
  }
  const std::string name = host + ":" + std::to_string(port);

  Socket s(::socket(AF_INET, SOCK_STREAM, 0));
  if (!s.valid()) {
    throw ConnectionLost(std::string("socket: ") + std::strerror(errno));
  }
  const int fd = s.fd();

  // Installed before connecting so shutdown() reaches the socket while the
  // connect or the handshake read is still pending.
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (cancelled_) {
      throw ConnectionLost("connect " + name + ": cancelled");
    }
    sock_ = std::move(s);
    peer_ = name;
  }

  Handshake hs;
  try {
    waitConnected(fd, addr, name);
    char buf[wire::kHandshakeBytes];
    recvExact(buf, sizeof(buf));
    hs = wire::decode_handshake(std::string_view(buf, sizeof(buf)));
  } catch (const std::exception&) {
    close();
    throw;
  }

  fresh_connection_ = true;
  std::cout << "[FrameClient] Connected to " << name << " (x=" << hs.x_extent
            << " y=" << hs.y_extent << " h=" << hs.sensor_height << ")" << std::endl;
  return hs;
}

// Non-blocking connect so an unreachable node fails within the timeout.
// The wait is sliced so a shutdown() during it is noticed promptly.
void FrameClient::waitConnected(int fd, const sockaddr_in& addr, const std::string& name) {
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (errno != EINPROGRESS) {
      throw ConnectionLost("connect " + name + ": " + std::strerror(errno));
    }
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(cfg_.connect_timeout_ms);
    while (true) {
      if (isCancelled()) {
        throw ConnectionLost("connect " + name + ": cancelled");
      }
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        throw ConnectionLost("connect " + name + ": timed out");
      }
      pollfd pfd{fd, POLLOUT, 0};
      const int rv = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left.count(), 100)));
      if (rv < 0 && errno == EINTR) continue;
      if (rv < 0) {
        throw ConnectionLost("connect " + name + ": " + std::strerror(errno));
      }
      if (rv > 0) break;
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
      throw ConnectionLost("connect " + name + ": " + std::strerror(err != 0 ? err : errno));
    }
  }
  if (isCancelled()) {
    throw ConnectionLost("connect " + name + ": cancelled");
  }
  fcntl(fd, F_SETFL, flags);
  net::set_no_delay(fd);
}

void FrameClient::recvExact(char* buf, size_t n) {
  size_t got = 0;
  while (got < n) {
    const ssize_t r = ::recv(sock_.fd(), buf + got, n - got, 0);
    if (r == 0) {
      throw ConnectionLost("connection to " + peer_ + " closed by peer");
    }
    if (r < 0) {
      if (errno == EINTR) continue;
      throw ConnectionLost("recv from " + peer_ + ": " + std::strerror(errno));
    }
    got += static_cast<size_t>(r);
  }
}

Frame FrameClient::receive() {
  if (!isConnected()) {
    throw ConnectionLost("not connected");
  }

  char hdrBuf[wire::kEnvelopeHeaderBytes];
  recvExact(hdrBuf, sizeof(hdrBuf));
  wire::EnvelopeHeader hdr;
  try {
    hdr = wire::decode_envelope_header(std::string_view(hdrBuf, sizeof(hdrBuf)));
  } catch (const ProtocolDesync&) {
    close();
    throw;
  }

  std::string payload(hdr.length, '\0');
  recvExact(payload.data(), payload.size());

  // The payload was consumed whole, so the stream stays aligned even when
  // the frame inside is rejected.
  Frame f = wire::decode_envelope_payload(hdr, payload);
  track(f.seq);
  return f;
}

void FrameClient::track(uint32_t seq) {
  if (last_seq_ && seq <= *last_seq_) {
    if (fresh_connection_) {
      std::cout << "[FrameClient] Sequence restarted at " << seq << " (was " << *last_seq_
                << "), sensor node restarted" << std::endl;
    } else {
      const std::string msg = "sequence went backwards: " + std::to_string(seq) +
                              " after " + std::to_string(*last_seq_);
      close();
      throw ProtocolDesync(msg);
    }
  } else if (last_seq_ && seq > *last_seq_ + 1) {
    dropped_ += seq - *last_seq_ - 1;
  }
  last_seq_ = seq;
  fresh_connection_ = false;
}

void FrameClient::shutdown() {
  std::lock_guard<std::mutex> lk(mu_);
  cancelled_ = true;
  sock_.shutdown();
}

bool FrameClient::isCancelled() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cancelled_;
}

void FrameClient::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (sock_.valid()) {
    sock_.shutdown();
    sock_.reset();
  }
}

bool FrameClient::isConnected() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sock_.valid();
}
