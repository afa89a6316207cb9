#include "repolens/quality/retry.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace repolens::quality {

Duration exponentialBackoff(int Attempt) {
  if (Attempt < 1) {
    Attempt = 1;
  }
  // Cap the shift; nobody configures thirty attempts.
  auto Shift = Attempt - 1 < 16 ? Attempt - 1 : 16;
  return std::chrono::seconds{1LL << Shift};
}

bool interruptibleSleep(Duration Delay, std::stop_token Stop) {
  std::mutex Mutex;
  std::condition_variable_any Wakeup;
  std::unique_lock Lock(Mutex);
  // Nothing notifies Wakeup; only the timeout or a stop request ends the wait.
  Wakeup.wait_for(Lock, Stop, Delay, [] { return false; });
  return !Stop.stop_requested();
}

} // namespace repolens::quality
