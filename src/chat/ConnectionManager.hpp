#ifndef __PARLEY_CONNECTION_MANAGER__
#define __PARLEY_CONNECTION_MANAGER__

#include "ConversationStateStore.hpp"
#include "EventLoop.hpp"
#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "Identity.hpp"
#include "MessageDeduplicator.hpp"
#include "ReconnectPolicy.hpp"
#include "Transport.hpp"
#include "TypingSignalThrottle.hpp"

namespace parley {
/**
 * @brief Owns the single transport connection of one conversation.
 *
 * Drives the reconnect loop, decodes and dispatches inbound frames into the
 * ConversationStateStore and exposes the outbound operations. Everything runs
 * on the event loop, so no member is locked.
 */
class ConnectionManager {
 public:
  ConnectionManager(
      EventLoop& _loop, shared_ptr<TransportFactory> _transportFactory,
      shared_ptr<ConversationStateStore> _store, const string& _apiBaseUrl,
      const ReconnectPolicy& _policy = ReconnectPolicy(),
      std::chrono::milliseconds typingDebounce = std::chrono::milliseconds(
          TypingSignalThrottle::DEFAULT_DEBOUNCE_MS),
      std::chrono::milliseconds typingIdleStop = std::chrono::milliseconds(0));

  virtual ~ConnectionManager();

  /**
   * @brief Opens a connection for the identity.
   *
   * A live or pending connection for the same identity is kept as is. A
   * connection for another identity is closed normally first.
   * @return false when the identity is incomplete; nothing is opened.
   */
  bool connect(const Identity& identity);

  /**
   * @brief Closes the connection normally and stops retrying. Safe to call
   * any number of times.
   */
  void disconnect();

  /**
   * @brief Disconnects and returns to IDLE, as if no identity had ever been
   * bound.
   */
  void reset();

  /**
   * @brief Sends a chat message. Surrounding whitespace is trimmed.
   * @return false when not open (NotConnected is recorded in the store) or
   * when nothing is left after trimming.
   */
  bool send(const string& text);

  void signalTyping(bool isTyping);

  /**
   * @brief Asks the server to mark the conversation read.
   * @return false when not open; nothing is sent.
   */
  bool markRead();

  /**
   * @brief User-triggered retry: drops the current connection, resets the
   * attempt counter and connects again without waiting.
   * @return false when no identity has been bound.
   */
  bool reconnect();

  inline ConnectionState getState() const { return state; }

  inline const Identity& getIdentity() const { return boundIdentity; }

  inline int getAttempt() const { return attempt; }

  inline bool hasPendingReconnect() const {
    return reconnectTimer != NO_TIMER;
  }

  inline MessageDeduplicator& getDeduplicator() { return deduplicator; }

  inline TypingSignalThrottle& getTypingThrottle() { return typingThrottle; }

 protected:
  EventLoop& loop;
  shared_ptr<TransportFactory> transportFactory;
  shared_ptr<ConversationStateStore> store;
  string apiBaseUrl;
  ReconnectPolicy policy;
  MessageDeduplicator deduplicator;
  TypingSignalThrottle typingThrottle;

  shared_ptr<Transport> transport;
  /**
   * @brief Bumped for every transport we open or drop. Callbacks carry the
   * value they were created with and are ignored once it is stale.
   */
  uint64_t transportSerial;
  ConnectionState state;
  Identity boundIdentity;
  int attempt;
  TimerId reconnectTimer;

  void openTransport();

  void closeTransport(int code, const string& reason);

  /** @brief Drops our reference on the next loop turn. */
  void releaseTransport();

  void handleOpen(uint64_t serial);

  void handleMessage(uint64_t serial, const string& text);

  void handleError(uint64_t serial, const string& description);

  void handleClose(uint64_t serial, int code, const string& reason);

  void dispatchFrame(const InboundFrame& frame);

  void scheduleReconnect();

  void cancelReconnect();

  void setState(ConnectionState newState);

  void setAttempt(int newAttempt);

  void sendTyping(bool isTyping);
};
}  // namespace parley

#endif  // __PARLEY_CONNECTION_MANAGER__
