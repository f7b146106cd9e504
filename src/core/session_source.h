#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include "config/config.h"
#include "core/frame.h"
#include "io/archive.h"
#include "io/backoff.h"
#include "io/frame_client.h"
#include "io/wire.h"

struct SessionStats {
  uint64_t frames{0};
  uint64_t dropped{0};      // sequence gaps seen by the client
  uint64_t malformed{0};
  uint64_t desyncs{0};
  uint64_t reconnects{0};
};

// Shared cancellation flag whose waits wake up on requestStop().
class StopSignal {
public:
  void request() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stopped_ = true;
    }
    cv_.notify_all();
  }
  bool stopped() const { return stopped_; }

  // False when stopped before the deadline.
  bool sleepUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_until(lk, deadline, [this] { return stopped_.load(); });
  }
  bool sleepFor(std::chrono::milliseconds d) {
    return sleepUntil(std::chrono::steady_clock::now() + d);
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopped_{false};
};

class LiveSource {
public:
  LiveSource(const SessionConfig& s, const NetworkConfig& n, StopSignal& stop, SessionStats& stats);

  std::optional<Frame> next();
  void interrupt() { client_.shutdown(); }
  std::optional<Handshake> handshake() const { return handshake_; }

private:
  bool connectOnce();
  void retryAfterFailure();

  SessionConfig session_;
  std::string host_;
  int port_;
  NetworkConfig net_;
  StopSignal& stop_;
  SessionStats& stats_;
  FrameClient client_;
  Backoff backoff_;
  std::optional<Handshake> handshake_;
  int failures_{0};
  bool ever_connected_{false};
  bool got_frame_{false};  // on the current connection
};

class PlaybackSource {
public:
  PlaybackSource(const SessionConfig& s, const PlaybackConfig& p, StopSignal& stop, SessionStats& stats);

  std::optional<Frame> next();
  void interrupt() {}
  std::optional<Handshake> handshake() const { return contents_.meta; }

private:
  ArchiveContents contents_;
  PlaybackConfig cfg_;
  StopSignal& stop_;
  SessionStats& stats_;
  size_t index_{0};
  std::chrono::steady_clock::time_point start_{};
};

// One viewing session over either a live sensor node or a recording.
// nextFrame() returns std::nullopt at end of session: after requestStop()
// or close(), or when a recording is exhausted.
class SessionSource {
public:
  // Throws ArchiveCorrupt (PLAYBACK) or ConfigError (LIVE without a valid
  // IPv4 host).
  static std::unique_ptr<SessionSource> open(const SessionConfig& s,
                                             const PlaybackConfig& p = {},
                                             const NetworkConfig& n = {});
  static std::unique_ptr<SessionSource> open(const AppConfig& cfg);

  ~SessionSource();
  SessionSource(const SessionSource&) = delete;
  SessionSource& operator=(const SessionSource&) = delete;

  // Throws ConnectionLost once max_reconnect_attempts is exhausted.
  std::optional<Frame> nextFrame();
  void close();
  // Safe to call from any thread or a signal-watching thread.
  void requestStop();

  SessionMode mode() const { return session_.mode; }
  Handshake metadata() const;
  SessionStats stats() const { return stats_; }

private:
  explicit SessionSource(const SessionConfig& s);

  SessionConfig session_;
  StopSignal stop_;
  SessionStats stats_;
  mutable std::mutex mu_;
  std::variant<std::monostate, LiveSource, PlaybackSource> impl_;
};
