#ifndef __PARLEY_CHAT_ERROR__
#define __PARLEY_CHAT_ERROR__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Failure categories of the conversation transport client.
 */
enum class ChatErrorCode {
  /** @brief Connect attempted without both conversation id and credential. */
  IDENTITY_INCOMPLETE = 0,
  /** @brief Low-level connection failure, recovered by the reconnect loop. */
  TRANSPORT_ERROR = 1,
  /** @brief An outbound operation was invoked while not open. */
  NOT_CONNECTED = 2,
  /** @brief The server sent an explicit error frame. */
  PROTOCOL_ERROR = 3,
  /** @brief Retries are exhausted until an explicit reconnect. */
  MAX_RECONNECT_EXCEEDED = 4,
  /** @brief An inbound frame was not JSON or did not match the schema. */
  MALFORMED_FRAME = 5
};

string chatErrorCodeName(ChatErrorCode code);

/**
 * @brief Error value surfaced through the ConversationStateStore.
 */
struct ChatError {
  ChatErrorCode code;
  string message;

  bool operator==(const ChatError& other) const {
    return code == other.code && message == other.message;
  }
  bool operator!=(const ChatError& other) const { return !(*this == other); }
};

/**
 * @brief Thrown by the frame decoder; caught at the dispatch point.
 */
class MalformedFrameError : public std::runtime_error {
 public:
  explicit MalformedFrameError(const string& what)
      : std::runtime_error(what) {}
};

inline std::ostream& operator<<(std::ostream& os, const ChatError& error) {
  os << chatErrorCodeName(error.code) << ": " << error.message;
  return os;
}
}  // namespace parley

#endif  // __PARLEY_CHAT_ERROR__
