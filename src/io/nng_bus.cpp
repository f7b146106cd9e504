#include "nng_bus.h"
#ifdef USE_NNG
#include <nng/nng.h>
#include <nng/protocol/pubsub0/pub.h>
#endif
#include "io/snapshot.h"
#include <json/json.h>
#include <iostream>

NngBus::~NngBus() {
  stop();
}

void NngBus::startPublisher(const SinkConfig& config) {
  stop();
  url_ = config.nng.url;
  topic_ = config.topic;
  min_interval_ = config.rate_limit > 0
                      ? std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                            std::chrono::duration<double>(1.0 / config.rate_limit))
                      : std::chrono::steady_clock::duration::zero();
  if (url_.empty()) {
    std::cerr << "[NngBus] sink '" << topic_ << "' has no url, disabled" << std::endl;
    return;
  }

#ifdef USE_NNG
  int rv = nng_pub0_open(&socket_);
  if (rv == 0) {
    open_ = true;
    rv = nng_listen(socket_, url_.c_str(), nullptr, 0);
  }
  if (rv != 0) {
    std::cerr << "[NngBus] " << topic_ << ": cannot publish on " << url_ << ": " << nng_strerror(rv)
              << std::endl;
    stop();
    return;
  }
  enabled_ = true;
  std::cout << "[NngBus] publishing '" << topic_ << "' on " << url_;
  if (config.rate_limit > 0) std::cout << " at most " << config.rate_limit << " Hz";
  std::cout << std::endl;
#else
  std::cout << "[NngBus] built without nng, sink '" << topic_ << "' disabled" << std::endl;
#endif
}

void NngBus::stop() {
#ifdef USE_NNG
  if (open_) {
    nng_close(socket_);
    open_ = false;
  }
#endif
  if (enabled_) {
    std::cout << "[NngBus] " << topic_ << ": " << published_ << " published, " << skipped_
              << " skipped by rate limit" << std::endl;
  }
  enabled_ = false;
}

bool NngBus::shouldPublish() {
  if (min_interval_ == std::chrono::steady_clock::duration::zero()) return true;
  const auto now = std::chrono::steady_clock::now();
  if (last_publish_ != std::chrono::steady_clock::time_point{} && now - last_publish_ < min_interval_) {
    ++skipped_;
    return false;
  }
  last_publish_ = now;
  return true;
}

std::string NngBus::serialize(const std::string& topic, const FrameResult& r) {
  Json::Value root = bays_message(r);
  root["v"] = 1;
  root["topic"] = topic;
  root["t"] = r.t;
  root["clusters"] = clusters_to_json(r.clusters.clusters);
  return to_compact(root);
}

void NngBus::publishFrame(const FrameResult& r) {
  if (!enabled_ || !shouldPublish()) return;

#ifdef USE_NNG
  const std::string body = topic_ + " " + serialize(topic_, r);
  // Without NNG_FLAG_ALLOC nng copies the buffer. A full pipe drops the message.
  const int rv = nng_send(socket_, const_cast<char*>(body.data()), body.size(), NNG_FLAG_NONBLOCK);
  if (rv != 0 && rv != NNG_EAGAIN) {
    std::cerr << "[NngBus] " << topic_ << ": send failed: " << nng_strerror(rv) << std::endl;
    return;
  }
  if (rv == 0) ++published_;
#endif
}
