#include "ManualEventLoop.hpp"
#include "TestHeaders.hpp"
#include "TypingSignalThrottle.hpp"

using namespace parley;

namespace {
struct Recorder {
  vector<bool> sent;
  function<void(bool)> sink() {
    return [this](bool typing) { sent.push_back(typing); };
  }
};
}  // namespace

TEST_CASE("Bursts of typing collapse into one signal",
          "[TypingSignalThrottle]") {
  ManualEventLoop loop;
  TypingSignalThrottle throttle(loop);
  Recorder recorder;

  throttle.signal(true, recorder.sink());
  loop.advance(100);
  throttle.signal(true, recorder.sink());
  loop.advance(100);
  throttle.signal(true, recorder.sink());
  REQUIRE(recorder.sent.empty());

  // The debounce restarted at t=200
  loop.advance(299);
  REQUIRE(recorder.sent.empty());
  loop.advance(1);
  REQUIRE(recorder.sent == vector<bool>({true}));
  REQUIRE(throttle.getLastSent() == optional<bool>(true));

  SECTION("Stop goes out immediately, exactly once") {
    throttle.signal(false, recorder.sink());
    REQUIRE(recorder.sent == vector<bool>({true, false}));
    throttle.signal(false, recorder.sink());
    loop.advance(1000);
    REQUIRE(recorder.sent == vector<bool>({true, false}));
  }

  SECTION("Repeating the sent value is silent") {
    throttle.signal(true, recorder.sink());
    loop.advance(1000);
    REQUIRE(recorder.sent == vector<bool>({true}));
  }
}

TEST_CASE("Stop cancels a pending start", "[TypingSignalThrottle]") {
  ManualEventLoop loop;
  TypingSignalThrottle throttle(loop);
  Recorder recorder;

  throttle.signal(true, recorder.sink());
  REQUIRE(throttle.hasPendingSignal());
  throttle.signal(false, recorder.sink());
  REQUIRE_FALSE(throttle.hasPendingSignal());
  REQUIRE(recorder.sent == vector<bool>({false}));

  loop.advance(1000);
  REQUIRE(recorder.sent == vector<bool>({false}));
  REQUIRE(loop.pendingTimerCount() == 0);
}

TEST_CASE("Reset drops the pending signal and the last value",
          "[TypingSignalThrottle]") {
  ManualEventLoop loop;
  TypingSignalThrottle throttle(loop);
  Recorder recorder;

  throttle.signal(true, recorder.sink());
  throttle.reset();
  loop.advance(1000);
  REQUIRE(recorder.sent.empty());
  REQUIRE_FALSE(throttle.getLastSent().has_value());

  // After a reset the first stop is sent again
  throttle.signal(false, recorder.sink());
  REQUIRE(recorder.sent == vector<bool>({false}));
}

TEST_CASE("Idle typing stops by itself", "[TypingSignalThrottle]") {
  ManualEventLoop loop;
  TypingSignalThrottle throttle(loop, std::chrono::milliseconds(300),
                                std::chrono::milliseconds(2000));
  Recorder recorder;

  throttle.signal(true, recorder.sink());
  loop.advance(300);
  REQUIRE(recorder.sent == vector<bool>({true}));

  loop.advance(1999);
  REQUIRE(recorder.sent == vector<bool>({true}));

  // More keystrokes push the deadline back without new traffic
  throttle.signal(true, recorder.sink());
  loop.advance(1999);
  REQUIRE(recorder.sent == vector<bool>({true}));

  loop.advance(1);
  REQUIRE(recorder.sent == vector<bool>({true, false}));
  REQUIRE(throttle.getLastSent() == optional<bool>(false));
}

TEST_CASE("Idle stop is off by default", "[TypingSignalThrottle]") {
  ManualEventLoop loop;
  TypingSignalThrottle throttle(loop);
  Recorder recorder;

  throttle.signal(true, recorder.sink());
  loop.advance(60000);
  REQUIRE(recorder.sent == vector<bool>({true}));
}
