#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>
#include <vector>
#include "core/errors.h"
#include "core/session_source.h"
#include "io/frame_client.h"
#include "io/frame_server.h"
#include "io/socket.h"
#include "io/wire.h"
#include "test_util.h"

#include <arpa/inet.h>
#include <sys/socket.h>

using testutil::make_frame;
using namespace std::chrono_literals;

namespace {

const Handshake kMeta{5.0f, 8.0f, 3.0f};

NetworkConfig local_net() {
  NetworkConfig n;
  n.listen = "127.0.0.1";
  n.port = 0;
  n.send_queue = 16;
  n.connect_timeout_ms = 1000;
  n.backoff_initial_ms = 20;
  n.backoff_max_ms = 100;
  return n;
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

SessionConfig live_to(uint16_t port) {
  SessionConfig s;
  s.mode = SessionMode::Live;
  s.host = "127.0.0.1";
  s.port = port;
  return s;
}

// A port nothing listens on.
uint16_t closed_port() {
  FrameServer scratch(local_net(), kMeta);
  EXPECT_TRUE(scratch.start());
  const uint16_t p = scratch.port();
  scratch.stop();
  return p;
}


// Loopback node that runs a fixed byte script on each accepted connection,
// for streams a well-behaved FrameServer never produces. The script gets
// the 1-based connection number.
class ScriptedNode {
public:
  using Script = std::function<void(int conn, int fd)>;

  explicit ScriptedNode(Script script) : script_(std::move(script)) {
    listener_ = Socket(::socket(AF_INET, SOCK_STREAM, 0));
    int one = 1;
    setsockopt(listener_.fd(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(::bind(listener_.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    EXPECT_EQ(::listen(listener_.fd(), 8), 0);
    socklen_t len = sizeof(addr);
    getsockname(listener_.fd(), reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { run(); });
  }

  ~ScriptedNode() {
    release();
    listener_.shutdown();
    thread_.join();
  }

  uint16_t port() const { return port_; }
  int connections() const { return connections_; }

  // Lets scripts blocked in hold() return.
  void release() { released_ = true; }
  void hold() const {
    while (!released_) std::this_thread::sleep_for(5ms);
  }

private:
  void run() {
    while (!released_) {
      Socket conn(::accept(listener_.fd(), nullptr, nullptr));
      if (!conn.valid()) return;
      script_(++connections_, conn.fd());
    }
  }

  Script script_;
  Socket listener_;
  uint16_t port_{0};
  std::atomic<int> connections_{0};
  std::atomic<bool> released_{false};
  std::thread thread_;
};

void send_bytes(int fd, const std::string& bytes) {
  EXPECT_TRUE(net::send_all(fd, bytes));
}

} // namespace

TEST(FrameLink, HandshakeThenFramesWithGapsCounted) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());
  ASSERT_NE(server.port(), 0);

  FrameClient client(local_net());
  EXPECT_EQ(client.connect("127.0.0.1", server.port()), kMeta);
  ASSERT_TRUE(wait_until([&] { return server.hasClient(); }));

  const Frame f1 = make_frame(1, 0.0, {{1, 2, 0, 0.5f, 9}});
  server.publish(f1);
  server.publish(make_frame(2, 0.05));
  server.publish(make_frame(5, 0.2));

  EXPECT_EQ(client.receive(), f1);
  EXPECT_EQ(client.receive().seq, 2u);
  EXPECT_EQ(client.receive().seq, 5u);
  EXPECT_EQ(client.dropped(), 2u);
  EXPECT_EQ(client.lastSeq().value_or(0), 5u);
  EXPECT_TRUE(wait_until([&] { return server.stats().sent == 3; }));
}

TEST(FrameLink, FramesWithoutClientAreDropped) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());
  server.publish(make_frame(1, 0.0));
  server.publish(make_frame(2, 0.1));
  EXPECT_EQ(server.stats().dropped, 2u);
  EXPECT_EQ(server.stats().sent, 0u);
}

TEST(FrameLink, NewClientReplacesOld) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());

  FrameClient first(local_net());
  first.connect("127.0.0.1", server.port());
  ASSERT_TRUE(wait_until([&] { return server.stats().clients == 1; }));

  FrameClient second(local_net());
  second.connect("127.0.0.1", server.port());
  ASSERT_TRUE(wait_until([&] { return server.stats().clients == 2; }));

  EXPECT_THROW(first.receive(), ConnectionLost);

  server.publish(make_frame(7, 1.0));
  EXPECT_EQ(second.receive().seq, 7u);
}

TEST(FrameLink, ConnectToClosedPortFails) {
  FrameClient client(local_net());
  EXPECT_THROW(client.connect("127.0.0.1", closed_port()), ConnectionLost);
  EXPECT_FALSE(client.isConnected());
  EXPECT_THROW(client.receive(), ConnectionLost);
}

TEST(FrameLink, ServerRejectsBadListenAddress) {
  NetworkConfig n = local_net();
  n.listen = "not-an-ip";
  FrameServer server(n, kMeta);
  EXPECT_FALSE(server.start());
  EXPECT_FALSE(server.isRunning());
}

TEST(LiveSession, ReconnectsAfterDisconnectAndKeepsOrder) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());

  auto src = SessionSource::open(live_to(server.port()), {}, local_net());
  EXPECT_EQ(src->mode(), SessionMode::Live);

  std::atomic<int> received{0};
  std::atomic<bool> producer_ok{true};
  std::thread producer([&] {
    if (!wait_until([&] { return server.stats().clients >= 1; })) {
      producer_ok = false;
      return;
    }
    for (uint32_t seq = 1; seq <= 10; ++seq) {
      if (seq == 5) {
        server.disconnectClient();
        if (!wait_until([&] { return server.stats().clients >= 2 && server.hasClient(); })) {
          producer_ok = false;
          return;
        }
      }
      server.publish(make_frame(seq, 0.1 * seq));
      if (!wait_until([&] { return received.load() >= static_cast<int>(seq); })) {
        producer_ok = false;
        return;
      }
    }
  });

  std::vector<uint32_t> seqs;
  while (seqs.size() < 10) {
    auto f = src->nextFrame();
    if (!f) break;
    seqs.push_back(f->seq);
    ++received;
  }
  producer.join();

  ASSERT_TRUE(producer_ok);
  std::vector<uint32_t> expected;
  for (uint32_t i = 1; i <= 10; ++i) expected.push_back(i);
  EXPECT_EQ(seqs, expected);
  EXPECT_GE(src->stats().reconnects, 1u);
  EXPECT_EQ(src->stats().frames, 10u);
  EXPECT_EQ(src->stats().dropped, 0u);
  EXPECT_EQ(src->metadata(), kMeta);
  src->close();
}

TEST(LiveSession, SensorRestartIsAcceptedAfterReconnect) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());
  auto src = SessionSource::open(live_to(server.port()), {}, local_net());

  std::atomic<int> received{0};
  std::thread producer([&] {
    wait_until([&] { return server.hasClient(); });
    server.publish(make_frame(40, 4.0));
    wait_until([&] { return received.load() >= 1; });
    server.disconnectClient();
    wait_until([&] { return server.stats().clients >= 2 && server.hasClient(); });
    server.publish(make_frame(1, 0.0));
  });

  auto a = src->nextFrame();
  ASSERT_TRUE(a.has_value());
  ++received;
  auto b = src->nextFrame();
  ASSERT_TRUE(b.has_value());
  producer.join();

  EXPECT_EQ(a->seq, 40u);
  EXPECT_EQ(b->seq, 1u);
  EXPECT_EQ(src->stats().desyncs, 0u);
}

TEST(LiveSession, GivesUpAfterMaxReconnectAttempts) {
  NetworkConfig n = local_net();
  n.max_reconnect_attempts = 3;
  auto src = SessionSource::open(live_to(closed_port()), {}, n);
  EXPECT_THROW(src->nextFrame(), ConnectionLost);
}

TEST(LiveSession, RequestStopInterruptsBackoff) {
  NetworkConfig n = local_net();
  n.backoff_initial_ms = 10000;
  n.backoff_max_ms = 10000;
  auto src = SessionSource::open(live_to(closed_port()), {}, n);

  std::thread stopper([&] {
    std::this_thread::sleep_for(100ms);
    src->requestStop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(src->nextFrame().has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
  stopper.join();
}

TEST(LiveSession, RequestStopInterruptsBlockingReceive) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());
  auto src = SessionSource::open(live_to(server.port()), {}, local_net());

  std::thread stopper([&] {
    wait_until([&] { return server.hasClient(); });
    std::this_thread::sleep_for(50ms);
    src->requestStop();
  });
  EXPECT_FALSE(src->nextFrame().has_value());
  stopper.join();
  // Geometry comes from the handshake once connected.
  EXPECT_EQ(src->metadata(), kMeta);
}

TEST(LiveSession, RequiresIpv4Host) {
  SessionConfig s = live_to(4811);
  s.host = "radar.local";
  EXPECT_THROW(SessionSource::open(s), ConfigError);
  s.host = "";
  EXPECT_THROW(SessionSource::open(s), ConfigError);
}

TEST(FrameLink, ServerStartStopDoesNotHang) {
  for (int i = 0; i < 50; ++i) {
    FrameServer server(local_net(), kMeta);
    ASSERT_TRUE(server.start());
    if (i % 2 == 0) server.publish(make_frame(static_cast<uint32_t>(i + 1), 0.0));
    server.stop();
    EXPECT_FALSE(server.isRunning());
    server.stop();
  }
}

TEST(FrameLink, ShutdownBeforeConnectCancelsIt) {
  FrameServer server(local_net(), kMeta);
  ASSERT_TRUE(server.start());
  FrameClient client(local_net());
  client.shutdown();
  EXPECT_THROW(client.connect("127.0.0.1", server.port()), ConnectionLost);
  EXPECT_FALSE(client.isConnected());
}

TEST(LiveSession, MalformedFrameMidStreamIsSkipped) {
  ScriptedNode node([&](int, int fd) {
    std::string bad = wire::encode_envelope(make_frame(2, 0.1));
    // Envelope sequence disagrees with the payload; the length is intact.
    bad[11] = 9;
    send_bytes(fd, wire::encode_handshake(kMeta) + wire::encode_envelope(make_frame(1, 0.0)) + bad +
                       wire::encode_envelope(make_frame(3, 0.2)));
    node.hold();
  });
  auto src = SessionSource::open(live_to(node.port()), {}, local_net());

  auto a = src->nextFrame();
  auto b = src->nextFrame();
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->seq, 1u);
  EXPECT_EQ(b->seq, 3u);
  EXPECT_EQ(src->stats().malformed, 1u);
  EXPECT_EQ(src->stats().desyncs, 0u);
  EXPECT_EQ(src->stats().reconnects, 0u);
  EXPECT_EQ(node.connections(), 1);
  node.release();
  src->close();
}

TEST(LiveSession, BadEnvelopeMagicReconnects) {
  ScriptedNode node([&](int conn, int fd) {
    send_bytes(fd, wire::encode_handshake(kMeta));
    if (conn == 1) {
      send_bytes(fd, std::string("XXXX") + std::string(8, '\0'));
      return;
    }
    send_bytes(fd, wire::encode_envelope(make_frame(1, 0.0)) + wire::encode_envelope(make_frame(2, 0.1)));
    node.hold();
  });
  auto src = SessionSource::open(live_to(node.port()), {}, local_net());

  auto a = src->nextFrame();
  auto b = src->nextFrame();
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->seq, 1u);
  EXPECT_EQ(b->seq, 2u);
  EXPECT_EQ(src->stats().desyncs, 1u);
  EXPECT_EQ(src->stats().reconnects, 1u);
  EXPECT_EQ(node.connections(), 2);
  node.release();
  src->close();
}

TEST(LiveSession, SequenceRegressionWithinConnectionReconnects) {
  ScriptedNode node([&](int conn, int fd) {
    send_bytes(fd, wire::encode_handshake(kMeta));
    if (conn == 1) {
      send_bytes(fd, wire::encode_envelope(make_frame(5, 0.5)) + wire::encode_envelope(make_frame(3, 0.3)));
      return;
    }
    send_bytes(fd, wire::encode_envelope(make_frame(6, 0.6)));
    node.hold();
  });
  auto src = SessionSource::open(live_to(node.port()), {}, local_net());

  auto a = src->nextFrame();
  auto b = src->nextFrame();
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(a->seq, 5u);
  EXPECT_EQ(b->seq, 6u);
  EXPECT_EQ(src->stats().desyncs, 1u);
  EXPECT_EQ(src->stats().reconnects, 1u);
  EXPECT_EQ(src->stats().frames, 2u);
  node.release();
  src->close();
}

TEST(LiveSession, DesyncingNodeIsRetriedWithBackoff) {
  ScriptedNode node([&](int, int fd) {
    send_bytes(fd, wire::encode_handshake(kMeta) + "JUNK" + std::string(8, '\0'));
  });
  NetworkConfig n = local_net();
  n.backoff_initial_ms = 200;
  n.backoff_max_ms = 2000;
  auto src = SessionSource::open(live_to(node.port()), {}, n);

  std::thread stopper([&] {
    std::this_thread::sleep_for(700ms);
    src->requestStop();
  });
  EXPECT_FALSE(src->nextFrame().has_value());
  stopper.join();

  // Delays of 200 and 400 ms fit three connections into the window.
  EXPECT_GE(node.connections(), 2);
  EXPECT_LE(node.connections(), 4);
  EXPECT_GE(src->stats().desyncs, 2u);
  EXPECT_LE(src->stats().desyncs, static_cast<uint64_t>(node.connections()));
  node.release();
}

TEST(LiveSession, DesyncsCountTowardMaxReconnectAttempts) {
  ScriptedNode node([&](int, int fd) {
    send_bytes(fd, wire::encode_handshake(kMeta) + "JUNK" + std::string(8, '\0'));
  });
  NetworkConfig n = local_net();
  n.max_reconnect_attempts = 3;
  auto src = SessionSource::open(live_to(node.port()), {}, n);
  EXPECT_THROW(src->nextFrame(), ConnectionLost);
  EXPECT_EQ(node.connections(), 3);
  EXPECT_EQ(src->stats().desyncs, 3u);
  node.release();
}

TEST(LiveSession, NodeThatDropsAfterHandshakeKeepsBackingOff) {
  ScriptedNode node([&](int, int fd) { send_bytes(fd, wire::encode_handshake(kMeta)); });
  NetworkConfig n = local_net();
  n.max_reconnect_attempts = 4;
  auto src = SessionSource::open(live_to(node.port()), {}, n);
  EXPECT_THROW(src->nextFrame(), ConnectionLost);
  EXPECT_EQ(node.connections(), 4);
  EXPECT_EQ(src->stats().frames, 0u);
  node.release();
}

TEST(LiveSession, RequestStopDuringHandshakeWaitReturnsPromptly) {
  ScriptedNode node([&](int, int) { node.hold(); });
  auto src = SessionSource::open(live_to(node.port()), {}, local_net());

  std::thread stopper([&] {
    wait_until([&] { return node.connections() >= 1; });
    std::this_thread::sleep_for(50ms);
    src->requestStop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  EXPECT_FALSE(src->nextFrame().has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  stopper.join();
  EXPECT_EQ(src->stats().desyncs, 0u);
  node.release();
}
