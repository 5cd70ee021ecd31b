#ifndef __PARLEY_MESSAGE_DEDUPLICATOR__
#define __PARLEY_MESSAGE_DEDUPLICATOR__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Remembers which message ids of the current conversation were
 * already applied to the log.
 *
 * Ids are only unique inside one conversation, so the set is reset whenever
 * the bound identity changes.
 */
class MessageDeduplicator {
 public:
  inline bool seen(const string& id) const { return ids.count(id) > 0; }

  inline void markSeen(const string& id) { ids.insert(id); }

  inline void reset() { ids.clear(); }

  inline size_t size() const { return ids.size(); }

 protected:
  unordered_set<string> ids;
};
}  // namespace parley

#endif  // __PARLEY_MESSAGE_DEDUPLICATOR__
