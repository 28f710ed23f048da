#pragma once
#include <chrono>

// Wall-clock budget for the iterative stages. A default-constructed Deadline
// never expires.
class Deadline {
public:
  using clock = std::chrono::steady_clock;

  Deadline() = default;
  static Deadline after_ms(int ms) {
    Deadline d;
    if (ms > 0) {
      d.bounded_ = true;
      d.at_ = clock::now() + std::chrono::milliseconds(ms);
    }
    return d;
  }

  bool expired() const { return bounded_ && clock::now() >= at_; }
  bool bounded() const noexcept { return bounded_; }

private:
  bool bounded_ = false;
  clock::time_point at_{};
};
