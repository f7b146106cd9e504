#pragma once
#include <string>
#include <cstdint>
#include <chrono>
#include "core/pipeline.h"
#include "config/config.h"
#ifdef USE_NNG
#include <nng/nng.h>
#endif

// nng pub sink for downstream consumers (signage, billing). Each message is
// "<topic> <json>" so subscribers can filter on the topic prefix; the JSON
// carries the bay states and clusters of one frame.
class NngBus {
  std::string url_;
  std::string topic_{"bays"};
  bool enabled_{false};
  std::chrono::steady_clock::duration min_interval_{};
  std::chrono::steady_clock::time_point last_publish_{};
  uint64_t published_{0};
  uint64_t skipped_{0};

#ifdef USE_NNG
  nng_socket socket_ = NNG_SOCKET_INITIALIZER;
  bool open_{false};
#endif

public:
  NngBus() = default;
  ~NngBus();

  NngBus(const NngBus&) = delete;
  NngBus& operator=(const NngBus&) = delete;

  void startPublisher(const SinkConfig& config);
  void publishFrame(const FrameResult& r);
  void stop();

  bool isEnabled() const { return enabled_; }

  static std::string serialize(const std::string& topic, const FrameResult& r);

private:
  bool shouldPublish();
};
