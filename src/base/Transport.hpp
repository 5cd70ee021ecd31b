#ifndef __PARLEY_TRANSPORT__
#define __PARLEY_TRANSPORT__

#include "Headers.hpp"

namespace parley {
/** @brief Close code for a normal, intentional shutdown. Never retried. */
const int CLOSE_NORMAL = 1000;
/** @brief Close code reported when the link died without a close frame. */
const int CLOSE_ABNORMAL = 1006;

/**
 * @brief Event sinks for one transport connection.
 *
 * All of them are invoked on the event loop thread.
 */
struct TransportCallbacks {
  /** @brief The WebSocket handshake completed. */
  function<void()> onOpen;
  /** @brief One complete text frame arrived. */
  function<void(const string&)> onMessage;
  /** @brief A low-level failure happened; a close always follows. */
  function<void(const string&)> onError;
  /** @brief The connection ended. Fired exactly once per `open()`. */
  function<void(int, const string&)> onClose;
};

/**
 * @brief Abstract API for one persistent, bidirectional message channel.
 *
 * A transport object is used for a single connection attempt: `open()` is
 * called once, then `send()` any number of times, then `close()`. After
 * `close()` returns no callback will fire.
 */
class Transport {
 public:
  virtual ~Transport() {}

  virtual void open(const string& url, const TransportCallbacks& callbacks) = 0;

  /**
   * @brief Queues one text frame. Frames are written in call order.
   */
  virtual void send(const string& text) = 0;

  /**
   * @brief Starts the closing handshake with the given code and detaches the
   * callbacks.
   */
  virtual void close(int code, const string& reason) = 0;
};

/**
 * @brief Creates a fresh transport for every connection attempt.
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  virtual shared_ptr<Transport> create() = 0;
};
}  // namespace parley

#endif  // __PARLEY_TRANSPORT__
