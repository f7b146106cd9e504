#pragma once
#include <cstdint>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <string>
#include "config/config.h"
#include "core/frame.h"
#include "io/socket.h"
#include "io/wire.h"

// Viewer-side end of the live stream. connect() reads the handshake;
// receive() blocks for the next frame. Reconnect policy lives in the
// caller (SessionSource), this class only reports what happened.
class FrameClient {
public:
  explicit FrameClient(const NetworkConfig& cfg);
  ~FrameClient();

  FrameClient(const FrameClient&) = delete;
  FrameClient& operator=(const FrameClient&) = delete;

  // Throws ConnectionLost when the node is unreachable or closes before the
  // handshake, ProtocolDesync when the handshake is not one.
  Handshake connect(const std::string& host, int port);

  // Throws ConnectionLost, ProtocolDesync or MalformedFrame. After
  // ProtocolDesync the connection is closed; after MalformedFrame the
  // stream is still aligned and receive() may be called again.
  Frame receive();

  // Safe from any thread; unblocks a pending connect() or receive(). The
  // client stays cancelled: later connect() calls throw ConnectionLost.
  void shutdown();
  void close();
  bool isConnected() const;

  // Frames missing between consecutive sequence numbers.
  uint64_t dropped() const { return dropped_; }
  std::optional<uint32_t> lastSeq() const { return last_seq_; }

private:
  void waitConnected(int fd, const sockaddr_in& addr, const std::string& name);
  bool isCancelled() const;
  void recvExact(char* buf, size_t n);
  void track(uint32_t seq);

  NetworkConfig cfg_;
  mutable std::mutex mu_;
  Socket sock_;
  std::string peer_;
  std::optional<uint32_t> last_seq_;
  bool cancelled_{false};
  bool fresh_connection_{false};
  uint64_t dropped_{0};
};
