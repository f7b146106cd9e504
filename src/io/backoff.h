#pragma once
#include <algorithm>
#include <chrono>

// Exponential reconnect delay: initial, initial*factor, ... capped at max.
class Backoff {
public:
  Backoff(int initial_ms, int max_ms, float factor)
    : initial_ms_(std::max(1, initial_ms)),
      max_ms_(std::max(initial_ms_, max_ms)),
      factor_(std::max(1.0f, factor)),
      current_ms_(initial_ms_) {}

  std::chrono::milliseconds next() {
    const int delay = current_ms_;
    current_ms_ = std::min(max_ms_, static_cast<int>(static_cast<float>(current_ms_) * factor_));
    ++attempts_;
    return std::chrono::milliseconds(delay);
  }

  void reset() {
    current_ms_ = initial_ms_;
    attempts_ = 0;
  }

  int attempts() const { return attempts_; }

private:
  int initial_ms_;
  int max_ms_;
  float factor_;
  int current_ms_;
  int attempts_{0};
};
