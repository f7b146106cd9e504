#include "session_source.h"
#include "core/errors.h"

#include <iostream>
#include <netinet/in.h>
#include "io/socket.h"

namespace {

// Each extent given in the config replaces the received one; without a
// handshake or archive header the config values stand alone.
Handshake merge_extents(const SessionConfig& s, const std::optional<Handshake>& received) {
  if (!received) return Handshake{s.x_extent, s.y_extent, s.sensor_height};
  Handshake hs = *received;
  if (s.x_explicit) hs.x_extent = s.x_extent;
  if (s.y_explicit) hs.y_extent = s.y_extent;
  if (s.height_explicit) hs.sensor_height = s.sensor_height;
  return hs;
}

void check_extents(const SessionConfig& s, const Handshake& hs) {
  if (!s.anyExplicit()) return;
  const Handshake mine = merge_extents(s, hs);
  if (mine != hs) {
    std::cout << "[Session] using configured extents x=" << mine.x_extent << " y=" << mine.y_extent
              << " h=" << mine.sensor_height << " instead of sensor x=" << hs.x_extent
              << " y=" << hs.y_extent << " h=" << hs.sensor_height << std::endl;
  }
}

} // namespace

// ---------------- LiveSource ----------------

LiveSource::LiveSource(const SessionConfig& s, const NetworkConfig& n, StopSignal& stop, SessionStats& stats)
  : session_(s), host_(s.host), port_(s.port), net_(n), stop_(stop), stats_(stats), client_(n),
    backoff_(n.backoff_initial_ms, n.backoff_max_ms, n.backoff_factor) {}

bool LiveSource::connectOnce() {
  try {
    handshake_ = client_.connect(host_, port_);
    check_extents(session_, *handshake_);
    if (ever_connected_) ++stats_.reconnects;
    ever_connected_ = true;
    got_frame_ = false;
    return true;
  } catch (const ConnectionLost& e) {
    if (stop_.stopped()) return false;
    std::cerr << "[Session] " << e.what() << std::endl;
  } catch (const ProtocolDesync& e) {
    ++stats_.desyncs;
    std::cerr << "[Session] bad handshake: " << e.what() << std::endl;
  }
  retryAfterFailure();
  return false;
}

// A connection only counts as healthy once it has delivered a frame, so a
// node that handshakes and then fails keeps the backoff growing.
void LiveSource::retryAfterFailure() {
  ++failures_;
  if (net_.max_reconnect_attempts > 0 && failures_ >= net_.max_reconnect_attempts) {
    throw ConnectionLost("giving up on " + host_ + ":" + std::to_string(port_) + " after " +
                         std::to_string(failures_) + " attempts");
  }
  const auto delay = backoff_.next();
  std::cout << "[Session] retrying in " << delay.count() << " ms" << std::endl;
  stop_.sleepFor(delay);
}

std::optional<Frame> LiveSource::next() {
  while (!stop_.stopped()) {
    if (!client_.isConnected() && !connectOnce()) continue;
    if (stop_.stopped()) break;

    try {
      Frame f = client_.receive();
      if (!got_frame_) {
        got_frame_ = true;
        failures_ = 0;
        backoff_.reset();
      }
      ++stats_.frames;
      stats_.dropped = client_.dropped();
      return f;
    } catch (const MalformedFrame& e) {
      ++stats_.malformed;
      std::cerr << "[Session] discarding frame: " << e.what() << std::endl;
    } catch (const ProtocolDesync& e) {
      ++stats_.desyncs;
      std::cerr << "[Session] stream out of sync, reconnecting: " << e.what() << std::endl;
      client_.close();
      retryAfterFailure();
    } catch (const ConnectionLost& e) {
      client_.close();
      if (stop_.stopped()) break;
      std::cerr << "[Session] " << e.what() << ", reconnecting" << std::endl;
      retryAfterFailure();
    }
  }
  client_.close();
  return std::nullopt;
}

// ---------------- PlaybackSource ----------------

PlaybackSource::PlaybackSource(const SessionConfig& s, const PlaybackConfig& p, StopSignal& stop,
                               SessionStats& stats)
  : contents_(read_archive(s.archive)), cfg_(p), stop_(stop), stats_(stats) {
  std::cout << "[Session] loaded " << contents_.frames.size() << " frames from " << s.archive << std::endl;
  check_extents(s, contents_.meta);
}

std::optional<Frame> PlaybackSource::next() {
  if (stop_.stopped() || index_ >= contents_.frames.size()) return std::nullopt;

  const Frame& f = contents_.frames[index_];
  if (index_ == 0) {
    start_ = std::chrono::steady_clock::now();
  } else if (cfg_.realtime_pacing) {
    // Schedule against the first frame so pacing does not drift.
    const double offset = (f.t - contents_.frames.front().t) / static_cast<double>(cfg_.speed);
    if (offset > 0.0) {
      const auto deadline = start_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                         std::chrono::duration<double>(offset));
      if (!stop_.sleepUntil(deadline)) return std::nullopt;
    }
  }
  ++index_;
  ++stats_.frames;
  return f;
}

// ---------------- SessionSource ----------------

SessionSource::SessionSource(const SessionConfig& s) : session_(s) {}

SessionSource::~SessionSource() {
  close();
}

std::unique_ptr<SessionSource> SessionSource::open(const SessionConfig& s, const PlaybackConfig& p,
                                                   const NetworkConfig& n) {
  std::unique_ptr<SessionSource> src(new SessionSource(s));
  if (s.mode == SessionMode::Live) {
    in_addr tmp{};
    if (!net::parse_ipv4(s.host, tmp)) {
      throw ConfigError("live session needs an IPv4 sensor address, got '" + s.host + "'");
    }
    src->impl_.emplace<LiveSource>(s, n, src->stop_, src->stats_);
    std::cout << "[Session] live from " << s.host << ":" << s.port << std::endl;
  } else {
    if (s.archive.empty()) {
      throw ConfigError("playback session needs an archive path");
    }
    src->impl_.emplace<PlaybackSource>(s, p, src->stop_, src->stats_);
  }
  return src;
}

std::unique_ptr<SessionSource> SessionSource::open(const AppConfig& cfg) {
  return open(cfg.session, cfg.playback, cfg.network);
}

std::optional<Frame> SessionSource::nextFrame() {
  if (auto* live = std::get_if<LiveSource>(&impl_)) return live->next();
  if (auto* pb = std::get_if<PlaybackSource>(&impl_)) return pb->next();
  return std::nullopt;
}

void SessionSource::requestStop() {
  stop_.request();
  std::lock_guard<std::mutex> lk(mu_);
  if (auto* live = std::get_if<LiveSource>(&impl_)) live->interrupt();
}

void SessionSource::close() {
  stop_.request();
  std::lock_guard<std::mutex> lk(mu_);
  impl_.emplace<std::monostate>();
}

Handshake SessionSource::metadata() const {
  std::optional<Handshake> received;
  if (auto* live = std::get_if<LiveSource>(&impl_)) received = live->handshake();
  if (auto* pb = std::get_if<PlaybackSource>(&impl_)) received = pb->handshake();
  return merge_extents(session_, received);
}
