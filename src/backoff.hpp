#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// Attempt ceiling plus exponential delay: retry k (1-based) waits base * 2^(k-1), capped at max_delay.
struct BackoffPolicy {
  std::size_t max_attempts = 1;
  std::chrono::milliseconds base_delay{0};
  std::chrono::milliseconds max_delay{0};

  std::chrono::milliseconds delay_before_retry(std::size_t retry) const {
    if(retry == 0 || base_delay.count() <= 0) return std::chrono::milliseconds(0);
    auto delay = base_delay;
    for(std::size_t i = 1; i < retry; ++i) {
      if(max_delay.count() > 0 && delay >= max_delay) break;
      delay *= 2;
    }
    if(max_delay.count() > 0 && delay > max_delay) delay = max_delay;
    return delay;
  }
};

void default_sleep(std::chrono::milliseconds delay);
