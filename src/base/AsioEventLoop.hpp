#ifndef __PARLEY_ASIO_EVENT_LOOP__
#define __PARLEY_ASIO_EVENT_LOOP__

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "EventLoop.hpp"

namespace parley {
/**
 * @brief EventLoop backed by a boost::asio::io_context.
 *
 * The WebSocket transport shares the same io_context, so network completions
 * and timers are serialized on whichever thread calls `run()`.
 */
class AsioEventLoop : public EventLoop {
 public:
  AsioEventLoop();

  virtual ~AsioEventLoop();

  void post(function<void()> task) override;

  TimerId runAfter(std::chrono::milliseconds delay,
                   function<void()> task) override;

  bool cancel(TimerId id) override;

  /** @brief Blocks processing events until `stop()` is called. */
  void run();

  /** @brief Makes `run()` return once the current handler finishes. */
  void stop();

  inline boost::asio::io_context& getIoContext() { return ioContext; }

  inline size_t pendingTimerCount() const { return timers.size(); }

 protected:
  boost::asio::io_context ioContext;
  /** @brief Keeps `run()` alive while the loop has nothing to do. */
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      workGuard;
  unordered_map<TimerId, shared_ptr<boost::asio::steady_timer>> timers;
  TimerId nextTimerId;
};
}  // namespace parley

#endif  // __PARLEY_ASIO_EVENT_LOOP__
