#include "AsioEventLoop.hpp"

#include <boost/asio/post.hpp>

namespace parley {
AsioEventLoop::AsioEventLoop()
    : workGuard(boost::asio::make_work_guard(ioContext)), nextTimerId(1) {}

AsioEventLoop::~AsioEventLoop() {
  for (auto& it : timers) {
    it.second->cancel();
  }
  timers.clear();
}

void AsioEventLoop::post(function<void()> task) {
  boost::asio::post(ioContext, std::move(task));
}

TimerId AsioEventLoop::runAfter(std::chrono::milliseconds delay,
                                function<void()> task) {
  TimerId id = nextTimerId++;
  auto timer = make_shared<boost::asio::steady_timer>(ioContext);
  timer->expires_after(delay);
  timers[id] = timer;
  VLOG(3) << "Timer " << id << " armed for " << delay.count() << "ms";
  timer->async_wait([this, id, timer,
                     task](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    auto it = timers.find(id);
    if (it == timers.end()) {
      // Cancelled after expiry but before this handler was dispatched
      return;
    }
    timers.erase(it);
    VLOG(3) << "Timer " << id << " fired";
    task();
  });
  return id;
}

bool AsioEventLoop::cancel(TimerId id) {
  auto it = timers.find(id);
  if (it == timers.end()) {
    return false;
  }
  it->second->cancel();
  timers.erase(it);
  VLOG(3) << "Timer " << id << " cancelled";
  return true;
}

void AsioEventLoop::run() {
  el::Helpers::setThreadName("event-loop");
  ioContext.run();
}

void AsioEventLoop::stop() { ioContext.stop(); }
}  // namespace parley
