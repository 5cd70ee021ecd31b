#ifndef __PARLEY_RECONNECT_POLICY__
#define __PARLEY_RECONNECT_POLICY__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Exponential backoff schedule for the reconnect loop.
 *
 * The policy is immutable after construction; both queries are pure.
 */
class ReconnectPolicy {
 public:
  static constexpr int64_t DEFAULT_BASE_DELAY_MS = 1000;
  static constexpr int64_t DEFAULT_CAP_DELAY_MS = 30000;
  static constexpr int DEFAULT_MAX_ATTEMPTS = 5;

  ReconnectPolicy();

  ReconnectPolicy(std::chrono::milliseconds _baseDelay,
                  std::chrono::milliseconds _capDelay, int _maxAttempts);

  /**
   * @brief Delay before retry number `attempt` (zero based):
   * `min(baseDelay * 2^attempt, capDelay)`.
   */
  std::chrono::milliseconds nextDelay(int attempt) const;

  /**
   * @brief Decides if a close should be followed by another attempt.
   * @return false for a normal closure or once `attempt >= maxAttempts`.
   */
  bool shouldRetry(int attempt, int closeCode) const;

  inline std::chrono::milliseconds getBaseDelay() const { return baseDelay; }
  inline std::chrono::milliseconds getCapDelay() const { return capDelay; }
  inline int getMaxAttempts() const { return maxAttempts; }

 protected:
  std::chrono::milliseconds baseDelay;
  std::chrono::milliseconds capDelay;
  int maxAttempts;
};
}  // namespace parley

#endif  // __PARLEY_RECONNECT_POLICY__
