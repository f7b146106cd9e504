#include "frame_server.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>

FrameServer::FrameServer(const NetworkConfig& cfg, const Handshake& hs) : cfg_(cfg), hs_(hs) {}

FrameServer::~FrameServer() {
  stop();
}

bool FrameServer::start() {
  if (running_) return true;

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));
  if (!net::parse_ipv4(cfg_.listen, addr.sin_addr)) {
    std::cerr << "[FrameServer] Invalid listen address: " << cfg_.listen << std::endl;
    return false;
  }

  Socket s(::socket(AF_INET, SOCK_STREAM, 0));
  if (!s.valid()) {
    std::cerr << "[FrameServer] Failed to create socket: " << std::strerror(errno) << std::endl;
    return false;
  }
  int one = 1;
  setsockopt(s.fd(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  if (::bind(s.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[FrameServer] Failed to bind " << cfg_.listen << ":" << cfg_.port
              << ": " << std::strerror(errno) << std::endl;
    return false;
  }
  if (::listen(s.fd(), 1) < 0) {
    std::cerr << "[FrameServer] Failed to listen: " << std::strerror(errno) << std::endl;
    return false;
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  getsockname(s.fd(), reinterpret_cast<sockaddr*>(&bound), &len);
  port_ = ntohs(bound.sin_port);
  listen_ = std::move(s);

  running_ = true;
  accept_th_ = std::thread([this] { acceptLoop(); });
  send_th_ = std::thread([this] { sendLoop(); });

  std::cout << "[FrameServer] Listening on " << cfg_.listen << ":" << port_ << std::endl;
  return true;
}

void FrameServer::stop() {
  {
    // Flipped under the queue lock so the send thread cannot miss the wakeup
    // between checking its predicate and blocking.
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
    running_ = false;
  }
  cv_.notify_all();
  if (accept_th_.joinable()) accept_th_.join();
  if (send_th_.joinable()) send_th_.join();
  listen_.reset();

  std::lock_guard<std::mutex> lk(mu_);
  if (client_) {
    client_->shutdown();
    client_.reset();
  }
  queue_.clear();
  std::cout << "[FrameServer] Stopped (sent=" << sent_ << " dropped=" << dropped_ << ")" << std::endl;
}

void FrameServer::acceptLoop() {
  while (running_) {
    pollfd pfd{listen_.fd(), POLLIN, 0};
    const int rv = ::poll(&pfd, 1, 200);
    if (rv < 0 && errno != EINTR) {
      std::cerr << "[FrameServer] poll failed: " << std::strerror(errno) << std::endl;
      break;
    }
    if (rv <= 0 || !(pfd.revents & POLLIN)) continue;

    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    auto conn = std::make_shared<Socket>(::accept(listen_.fd(), reinterpret_cast<sockaddr*>(&peer), &len));
    if (!conn->valid()) {
      std::cerr << "[FrameServer] accept failed: " << std::strerror(errno) << std::endl;
      continue;
    }
    const std::string name = net::peer_name(peer);

    net::set_no_delay(conn->fd());
    net::set_send_timeout(conn->fd(), std::chrono::milliseconds(cfg_.send_timeout_ms));

    // The handshake goes out before the client can receive any frame.
    if (!net::send_all(conn->fd(), wire::encode_handshake(hs_))) {
      std::cerr << "[FrameServer] Handshake to " << name << " failed: " << std::strerror(errno) << std::endl;
      continue;
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      if (client_) {
        std::cout << "[FrameServer] Replacing connection " << client_name_ << std::endl;
        client_->shutdown();
      }
      client_ = std::move(conn);
      client_name_ = name;
    }
    ++clients_;
    std::cout << "[FrameServer] New Connection: " << name << std::endl;
  }
}

void FrameServer::sendLoop() {
  while (true) {
    std::string env;
    std::shared_ptr<Socket> target;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return !running_ || !queue_.empty(); });
      if (!running_) return;
      env = std::move(queue_.front());
      queue_.pop_front();
      target = client_;
    }

    if (!target) {
      ++dropped_;
      continue;
    }
    if (net::send_all(target->fd(), env)) {
      ++sent_;
    } else {
      ++dropped_;
      const int err = errno;
      dropClient(target, (err == EAGAIN || err == EWOULDBLOCK) ? std::string("send timeout")
                                                                : std::string(std::strerror(err)));
    }
  }
}

void FrameServer::dropClient(const std::shared_ptr<Socket>& which, const std::string& why) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!client_ || client_ != which) return;  // already replaced
  std::cout << "[FrameServer] Close Connection: " << client_name_ << " (" << why << ")" << std::endl;
  client_->shutdown();
  client_.reset();
  queue_.clear();
}

void FrameServer::publish(const Frame& f) {
  if (!running_) return;
  std::string env = wire::encode_envelope(f);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!client_) {
      ++dropped_;
      return;
    }
    while (static_cast<int>(queue_.size()) >= cfg_.send_queue) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(env));
  }
  cv_.notify_one();
}

void FrameServer::disconnectClient() {
  std::shared_ptr<Socket> current;
  {
    std::lock_guard<std::mutex> lk(mu_);
    current = client_;
  }
  if (current) dropClient(current, "disconnect requested");
}

bool FrameServer::hasClient() const {
  std::lock_guard<std::mutex> lk(mu_);
  return client_ != nullptr;
}

FrameServer::Stats FrameServer::stats() const {
  return Stats{sent_.load(), dropped_.load(), clients_.load()};
}
