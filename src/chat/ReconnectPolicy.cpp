#include "ReconnectPolicy.hpp"

#include "Transport.hpp"

namespace parley {
ReconnectPolicy::ReconnectPolicy()
    : ReconnectPolicy(std::chrono::milliseconds(DEFAULT_BASE_DELAY_MS),
                      std::chrono::milliseconds(DEFAULT_CAP_DELAY_MS),
                      DEFAULT_MAX_ATTEMPTS) {}

ReconnectPolicy::ReconnectPolicy(std::chrono::milliseconds _baseDelay,
                                 std::chrono::milliseconds _capDelay,
                                 int _maxAttempts)
    : baseDelay(_baseDelay), capDelay(_capDelay), maxAttempts(_maxAttempts) {
  if (baseDelay.count() <= 0 || capDelay < baseDelay || maxAttempts <= 0) {
    STFATAL << "Invalid reconnect policy: base=" << baseDelay.count()
            << "ms cap=" << capDelay.count() << "ms attempts=" << maxAttempts;
  }
}

std::chrono::milliseconds ReconnectPolicy::nextDelay(int attempt) const {
  // Double step by step so large attempt numbers cannot overflow
  auto delay = baseDelay;
  for (int a = 0; a < attempt; a++) {
    if (delay >= capDelay) {
      break;
    }
    delay *= 2;
  }
  return std::min(delay, capDelay);
}

bool ReconnectPolicy::shouldRetry(int attempt, int closeCode) const {
  if (closeCode == CLOSE_NORMAL) {
    return false;
  }
  return attempt < maxAttempts;
}
}  // namespace parley
