#ifndef __TCODE_GRACE_TIMER__
#define __TCODE_GRACE_TIMER__

#include "Headers.hpp"

namespace tcode {
/**
 * @brief Runs a callback once after a delay unless canceled first.
 *
 * Destroying a timer that is still pending runs the callback immediately, so
 * whatever it releases is never leaked. The callback runs at most once and
 * must not destroy the timer that invokes it.
 */
class GraceTimer {
 public:
  GraceTimer(chrono::milliseconds _duration, std::function<void()> _onExpire);
  ~GraceTimer();

  /** @brief Prevents the callback from running. No-op once it has run. */
  void cancel();
  /** @brief Runs the callback now if the timer is still pending. */
  void expireNow();

  bool isPending();
  bool hasFired();
  chrono::milliseconds getDuration() const { return duration; }

 protected:
  enum class TimerState { PENDING, FIRED, CANCELED };

  void run();
  bool transitionTo(TimerState newState);

  chrono::milliseconds duration;
  std::function<void()> onExpire;

  std::mutex timerMutex;
  std::condition_variable timerCondition;
  TimerState state;
  std::thread timerThread;
};
}  // namespace tcode

#endif  // __TCODE_GRACE_TIMER__
