#include "GraceTimer.hpp"

#include "LogHandler.hpp"

namespace tcode {
GraceTimer::GraceTimer(chrono::milliseconds _duration,
                       std::function<void()> _onExpire)
    : duration(_duration),
      onExpire(std::move(_onExpire)),
      state(TimerState::PENDING) {
  timerThread = std::thread(&GraceTimer::run, this);
}

GraceTimer::~GraceTimer() {
  expireNow();
  if (timerThread.joinable()) {
    timerThread.join();
  }
}

void GraceTimer::cancel() {
  if (transitionTo(TimerState::CANCELED)) {
    CVLOG(1, SESSION_LOGGER.c_str()) << "Grace timer canceled";
  }
}

void GraceTimer::expireNow() {
  if (transitionTo(TimerState::FIRED)) {
    onExpire();
  }
}

bool GraceTimer::isPending() {
  lock_guard<std::mutex> guard(timerMutex);
  return state == TimerState::PENDING;
}

bool GraceTimer::hasFired() {
  lock_guard<std::mutex> guard(timerMutex);
  return state == TimerState::FIRED;
}

void GraceTimer::run() {
  el::Helpers::setThreadName("grace-timer");
  {
    unique_lock<std::mutex> lock(timerMutex);
    timerCondition.wait_for(lock, duration,
                            [this] { return state != TimerState::PENDING; });
    if (state != TimerState::PENDING) {
      return;
    }
    state = TimerState::FIRED;
  }
  onExpire();
}

bool GraceTimer::transitionTo(TimerState newState) {
  {
    lock_guard<std::mutex> guard(timerMutex);
    if (state != TimerState::PENDING) {
      return false;
    }
    state = newState;
  }
  timerCondition.notify_all();
  return true;
}
}  // namespace tcode
