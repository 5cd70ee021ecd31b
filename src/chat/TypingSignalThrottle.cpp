#include "TypingSignalThrottle.hpp"

namespace parley {
TypingSignalThrottle::TypingSignalThrottle(EventLoop& _loop,
                                           std::chrono::milliseconds _debounce,
                                           std::chrono::milliseconds _idleStop)
    : loop(_loop),
      debounce(_debounce),
      idleStop(_idleStop),
      debounceTimer(NO_TIMER),
      idleTimer(NO_TIMER) {}

TypingSignalThrottle::~TypingSignalThrottle() { reset(); }

void TypingSignalThrottle::signal(bool isTyping,
                                  const function<void(bool)>& send) {
  pendingSend = send;
  if (!isTyping) {
    // A queued true must never follow the stop
    cancelTimer(&debounceTimer);
    cancelTimer(&idleTimer);
    if (lastSent && *lastSent == false) {
      VLOG(3) << "Typing stop suppressed, already sent";
      return;
    }
    lastSent = false;
    VLOG(2) << "Sending typing=false";
    send(false);
    return;
  }

  if (lastSent && *lastSent && debounceTimer == NO_TIMER) {
    // Still typing: only push the idle deadline back
    armIdleStop();
    return;
  }
  cancelTimer(&debounceTimer);
  debounceTimer = loop.runAfter(debounce, [this]() { fireDebounce(); });
  VLOG(3) << "Typing debounce armed (" << debounce.count() << "ms)";
}

void TypingSignalThrottle::reset() {
  cancelTimer(&debounceTimer);
  cancelTimer(&idleTimer);
  lastSent.reset();
  pendingSend = nullptr;
}

void TypingSignalThrottle::fireDebounce() {
  debounceTimer = NO_TIMER;
  if (lastSent && *lastSent) {
    armIdleStop();
    return;
  }
  lastSent = true;
  VLOG(2) << "Sending typing=true";
  if (pendingSend) {
    pendingSend(true);
  }
  armIdleStop();
}

void TypingSignalThrottle::fireIdleStop() {
  idleTimer = NO_TIMER;
  if (!lastSent || *lastSent == false) {
    return;
  }
  lastSent = false;
  VLOG(2) << "Typing idle for " << idleStop.count()
          << "ms, sending typing=false";
  if (pendingSend) {
    pendingSend(false);
  }
}

void TypingSignalThrottle::armIdleStop() {
  if (idleStop.count() <= 0) {
    return;
  }
  cancelTimer(&idleTimer);
  idleTimer = loop.runAfter(idleStop, [this]() { fireIdleStop(); });
}

void TypingSignalThrottle::cancelTimer(TimerId* timer) {
  if (*timer != NO_TIMER) {
    loop.cancel(*timer);
    *timer = NO_TIMER;
  }
}
}  // namespace parley
