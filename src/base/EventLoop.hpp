#ifndef __PARLEY_EVENT_LOOP__
#define __PARLEY_EVENT_LOOP__

#include "Headers.hpp"

namespace parley {
/** @brief Handle for a scheduled callback. Zero never names a live timer. */
typedef uint64_t TimerId;

const TimerId NO_TIMER = 0;

/**
 * @brief Single-threaded cooperative scheduler that drives the chat stack.
 *
 * Every transport callback, timer callback and posted task runs on the loop
 * thread, one at a time and to completion, so the components that hang off
 * the loop never lock.
 */
class EventLoop {
 public:
  virtual ~EventLoop() {}

  /**
   * @brief Queues a task to run on the loop thread.
   *
   * This is the only member that may be called from another thread.
   */
  virtual void post(function<void()> task) = 0;

  /**
   * @brief Runs the task once after the delay has elapsed.
   * @return A non-zero id that can be handed to `cancel()`.
   */
  virtual TimerId runAfter(std::chrono::milliseconds delay,
                           function<void()> task) = 0;

  /**
   * @brief Cancels a pending timer.
   * @return false when the timer already fired, was cancelled or is unknown.
   */
  virtual bool cancel(TimerId id) = 0;
};
}  // namespace parley

#endif  // __PARLEY_EVENT_LOOP__
