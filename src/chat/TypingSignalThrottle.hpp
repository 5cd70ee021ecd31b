#ifndef __PARLEY_TYPING_SIGNAL_THROTTLE__
#define __PARLEY_TYPING_SIGNAL_THROTTLE__

#include "EventLoop.hpp"
#include "Headers.hpp"

namespace parley {
/**
 * @brief Coalesces outbound typing signals.
 *
 * A `true` is debounced and only sent once the burst of calls has been
 * quiet for `debounce`. A `false` goes out immediately. A value equal to the
 * last one sent is never repeated on the wire.
 */
class TypingSignalThrottle {
 public:
  static constexpr int64_t DEFAULT_DEBOUNCE_MS = 300;

  /**
   * @param _idleStop When non-zero, a sent `true` is followed by an automatic
   * `false` after this long without another `signal(true)`.
   */
  TypingSignalThrottle(
      EventLoop& _loop,
      std::chrono::milliseconds _debounce =
          std::chrono::milliseconds(DEFAULT_DEBOUNCE_MS),
      std::chrono::milliseconds _idleStop = std::chrono::milliseconds(0));

  ~TypingSignalThrottle();

  void signal(bool isTyping, const function<void(bool)>& send);

  /**
   * @brief Cancels both timers and forgets the last sent value. Nothing is
   * sent.
   */
  void reset();

  inline optional<bool> getLastSent() const { return lastSent; }

  inline bool hasPendingSignal() const { return debounceTimer != NO_TIMER; }

 protected:
  EventLoop& loop;
  std::chrono::milliseconds debounce;
  std::chrono::milliseconds idleStop;
  optional<bool> lastSent;
  TimerId debounceTimer;
  TimerId idleTimer;
  /** @brief Sink captured by the most recent `signal()` call. */
  function<void(bool)> pendingSend;

  void fireDebounce();

  void fireIdleStop();

  void armIdleStop();

  void cancelTimer(TimerId* timer);
};
}  // namespace parley

#endif  // __PARLEY_TYPING_SIGNAL_THROTTLE__
