#pragma once
#include <chrono>
#include <functional>
#include <stop_token>

namespace repolens::quality {

using Duration = std::chrono::milliseconds;

// Blocks for the given time. Returns false when woken early by a stop
// request.
using Sleeper = std::function<bool(Duration, std::stop_token)>;

// Delay before the attempt that follows failed attempt number Attempt (1-based).
using Backoff = std::function<Duration(int Attempt)>;

// 2^(Attempt-1) seconds: 1s, 2s, 4s, ...
Duration exponentialBackoff(int Attempt);

// Waits on a condition variable so a stop request ends the wait at once.
bool interruptibleSleep(Duration Delay, std::stop_token Stop);

struct RetryPolicy {
  int MaxAttempts = 3;
  Backoff Delay = exponentialBackoff;
  Sleeper Sleep = interruptibleSleep;
};

} // namespace repolens::quality
