#ifndef __PARLEY_WEB_SOCKET_TRANSPORT__
#define __PARLEY_WEB_SOCKET_TRANSPORT__

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "Transport.hpp"
#include "WebSocketUrl.hpp"

namespace parley {
class WebSocketSession;

/**
 * @brief Transport implementation over Boost.Beast WebSockets.
 *
 * `ws://` URLs use a plain TCP stream, `wss://` URLs use OpenSSL with SNI and
 * peer verification. Network completions run on the io_context that also
 * backs the AsioEventLoop.
 */
class WebSocketTransport
    : public Transport,
      public std::enable_shared_from_this<WebSocketTransport> {
 public:
  WebSocketTransport(boost::asio::io_context& _ioContext,
                     shared_ptr<boost::asio::ssl::context> _sslContext);

  virtual ~WebSocketTransport();

  void open(const string& url, const TransportCallbacks& callbacks) override;

  void send(const string& text) override;

  void close(int code, const string& reason) override;

 protected:
  boost::asio::io_context& ioContext;
  shared_ptr<boost::asio::ssl::context> sslContext;
  /** @brief Live protocol state; null until `open()` parsed the URL. */
  shared_ptr<WebSocketSession> session;
  /** @brief Set once `close()` ran; suppresses deferred failure reports. */
  bool closed;
};

/**
 * @brief Creates WebSocketTransports that share one TLS client context.
 */
class WebSocketTransportFactory : public TransportFactory {
 public:
  explicit WebSocketTransportFactory(boost::asio::io_context& _ioContext);

  shared_ptr<Transport> create() override;

 protected:
  boost::asio::io_context& ioContext;
  shared_ptr<boost::asio::ssl::context> sslContext;
};
}  // namespace parley

#endif  // __PARLEY_WEB_SOCKET_TRANSPORT__
