#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "config/config.h"
#include "core/frame.h"
#include "io/socket.h"
#include "io/wire.h"

// Sensor-side end of the live stream. Serves one viewer at a time; a new
// connection replaces the previous one. publish() never blocks the sensor:
// frames go to a bounded queue drained by a sender thread, and a client
// that cannot keep up loses frames (or its connection on send timeout).
class FrameServer {
public:
  FrameServer(const NetworkConfig& cfg, const Handshake& hs);
  ~FrameServer();

  FrameServer(const FrameServer&) = delete;
  FrameServer& operator=(const FrameServer&) = delete;

  // Binds and starts the accept and sender threads. False when the socket
  // cannot be bound (logged).
  bool start();
  void stop();

  void publish(const Frame& f);
  void disconnectClient();

  bool isRunning() const { return running_; }
  bool hasClient() const;
  uint16_t port() const { return port_; }

  struct Stats {
    uint64_t sent{0};
    uint64_t dropped{0};
    uint64_t clients{0};
  };
  Stats stats() const;

private:
  void acceptLoop();
  void sendLoop();
  void dropClient(const std::shared_ptr<Socket>& which, const std::string& why);

  NetworkConfig cfg_;
  Handshake hs_;
  Socket listen_;
  uint16_t port_{0};

  std::atomic<bool> running_{false};
  std::thread accept_th_;
  std::thread send_th_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::shared_ptr<Socket> client_;
  std::string client_name_;
  std::deque<std::string> queue_;   // encoded envelopes

  std::atomic<uint64_t> sent_{0};
  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> clients_{0};
};
