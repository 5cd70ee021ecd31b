#ifndef __PARLEY_LIFECYCLE_COORDINATOR__
#define __PARLEY_LIFECYCLE_COORDINATOR__

#include "ConnectionManager.hpp"
#include "ConversationStateStore.hpp"
#include "Headers.hpp"
#include "Identity.hpp"

namespace parley {
/**
 * @brief Binds the ConnectionManager to the identity the host application is
 * currently showing.
 *
 * Hosts may run setup and teardown hooks twice for the same identity. Each
 * bind returns a generation number and a teardown only acts when it presents
 * the current generation, so a superseded teardown is a no-op and a repeated
 * bind never opens a second connection.
 */
class LifecycleCoordinator {
 public:
  typedef uint64_t Generation;

  LifecycleCoordinator(ConnectionManager& _manager,
                       shared_ptr<ConversationStateStore> _store);

  ~LifecycleCoordinator();

  /**
   * @brief Makes `identity` the current identity.
   *
   * Binding the identity that is already current returns the current
   * generation and does nothing else. Otherwise the previous identity is
   * torn down and, when the new one is complete, a connection is opened. A
   * partial identity leaves the manager idle.
   * @return the generation to hand back to `unbind()`.
   */
  Generation bind(const Identity& identity);

  /**
   * @brief Teardown paired with the bind that returned `generation`.
   * @return false when the generation is stale and nothing was done.
   */
  bool unbind(Generation generation);

  inline Generation getGeneration() const { return generation; }

  inline const Identity& getIdentity() const { return current; }

 protected:
  ConnectionManager& manager;
  shared_ptr<ConversationStateStore> store;
  Identity current;
  Generation generation;

  /**
   * @brief Disconnects the current identity and clears its per-conversation
   * state. The message log is only dropped when `clearLog` is set.
   */
  void teardown(bool clearLog);
};
}  // namespace parley

#endif  // __PARLEY_LIFECYCLE_COORDINATOR__
