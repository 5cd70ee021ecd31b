#ifndef __PARLEY_IDENTITY__
#define __PARLEY_IDENTITY__

#include "Headers.hpp"

namespace parley {
/**
 * @brief The (conversationId, credential) pair a connection is bound to.
 *
 * An empty string means the field has not been provided yet.
 */
struct Identity {
  string conversationId;
  string credential;

  Identity() {}
  Identity(const string& _conversationId, const string& _credential)
      : conversationId(_conversationId), credential(_credential) {}

  inline bool isComplete() const {
    return !conversationId.empty() && !credential.empty();
  }

  inline bool isEmpty() const {
    return conversationId.empty() && credential.empty();
  }

  bool operator==(const Identity& other) const {
    return conversationId == other.conversationId &&
           credential == other.credential;
  }
  bool operator!=(const Identity& other) const { return !(*this == other); }
};

// Never print the credential itself
inline std::ostream& operator<<(std::ostream& os, const Identity& identity) {
  os << "conversation="
     << (identity.conversationId.empty() ? "<none>" : identity.conversationId)
     << " credential=" << (identity.credential.empty() ? "<none>" : "<set>");
  return os;
}
}  // namespace parley

#endif  // __PARLEY_IDENTITY__
