#ifndef __PARLEY_CONVERSATION_STATE_STORE__
#define __PARLEY_CONVERSATION_STATE_STORE__

#include "ChatError.hpp"
#include "Headers.hpp"
#include "Message.hpp"

namespace parley {
enum class ConnectionState {
  IDLE = 0,
  CONNECTING = 1,
  OPEN = 2,
  CLOSING = 3,
  CLOSED = 4
};

string connectionStateName(ConnectionState state);

/**
 * @brief What changed in the store, passed to every listener.
 */
enum class StoreChange {
  MESSAGES = 0,
  READ_FLAGS = 1,
  REMOTE_TYPING = 2,
  ERROR_STATE = 3,
  CONNECTION_STATE = 4,
  RECONNECT_ATTEMPT = 5,
  RESET = 6
};

typedef uint64_t SubscriptionId;

/**
 * @brief Observable state of the active conversation.
 *
 * The store is the only owner of the message log. The transport layer
 * appends and patches through this interface and the application renders by
 * subscribing. All calls happen on the event loop thread.
 */
class ConversationStateStore {
 public:
  typedef function<void(StoreChange)> Listener;

  ConversationStateStore();

  /**
   * @brief Replaces the log with a history snapshot. Repeated ids inside the
   * snapshot keep their first occurrence.
   */
  void seedHistory(const vector<Message>& history);

  /**
   * @brief Appends a message at the end of the log.
   * @return false when a message with the same id already exists; the read
   * flags of the existing entry are merged (never cleared) instead.
   */
  bool appendMessage(const Message& message);

  /**
   * @brief Marks the listed messages as read by `reader`.
   * @return the number of entries whose flag flipped.
   */
  int applyReadReceipt(const vector<string>& ids, SenderRole reader);

  void setRemoteTyping(bool typing);

  void setError(const ChatError& error);

  void clearError();

  void setConnectionState(ConnectionState state);

  void setReconnectAttempt(int attempt);

  /** @brief Returns everything to the initial `Idle` state. */
  void reset();

  inline const vector<Message>& messages() const { return log; }

  const Message* findMessage(const string& id) const;

  inline bool hasMessage(const string& id) const {
    return index.find(id) != index.end();
  }

  inline ConnectionState getConnectionState() const { return connectionState; }

  inline bool isConnected() const {
    return connectionState == ConnectionState::OPEN;
  }

  inline bool isRemoteTyping() const { return remoteTyping; }

  inline const optional<ChatError>& getError() const { return error; }

  inline int getReconnectAttempt() const { return reconnectAttempt; }

  SubscriptionId subscribe(const Listener& listener);

  bool unsubscribe(SubscriptionId id);

 protected:
  vector<Message> log;
  /** @brief Message id to position in `log`. */
  unordered_map<string, size_t> index;
  ConnectionState connectionState;
  bool remoteTyping;
  optional<ChatError> error;
  int reconnectAttempt;
  map<SubscriptionId, Listener> listeners;
  SubscriptionId nextSubscriptionId;

  void notify(StoreChange change);
};
}  // namespace parley

#endif  // __PARLEY_CONVERSATION_STATE_STORE__
