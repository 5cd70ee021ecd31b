#include "WebSocketTransport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace parley {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// Covers DNS, TCP connect and the TLS handshake; the WebSocket layer then
// switches to its own suggested client timeouts.
const std::chrono::seconds CONNECT_TIMEOUT(30);

// Reported when the peer closed without a status code
const int CLOSE_NO_STATUS = 1005;

/**
 * @brief Protocol state of one WebSocket connection, independent of whether
 * the stream is plain or TLS.
 */
class WebSocketSession {
 public:
  virtual ~WebSocketSession() {}
  virtual void start() = 0;
  virtual void send(const string& text) = 0;
  virtual void close(int code, const string& reason) = 0;
};

namespace {
typedef websocket::stream<beast::tcp_stream> PlainStream;
typedef websocket::stream<beast::ssl_stream<beast::tcp_stream>> TlsStream;

void secureStream(PlainStream& ws, const WebSocketUrl& url,
                  function<void(beast::error_code)> next) {
  next(beast::error_code());
}

void secureStream(TlsStream& ws, const WebSocketUrl& url,
                  function<void(beast::error_code)> next) {
  if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                url.host.c_str())) {
    next(beast::error_code(static_cast<int>(::ERR_get_error()),
                           asio::error::get_ssl_category()));
    return;
  }
  ws.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
  beast::get_lowest_layer(ws).expires_after(CONNECT_TIMEOUT);
  ws.next_layer().async_handshake(ssl::stream_base::client, std::move(next));
}

template <class Stream>
class BasicWebSocketSession
    : public WebSocketSession,
      public std::enable_shared_from_this<BasicWebSocketSession<Stream>> {
 public:
  template <class... StreamArgs>
  BasicWebSocketSession(asio::io_context& ioContext, const WebSocketUrl& _url,
                        const TransportCallbacks& _callbacks,
                        StreamArgs&... streamArgs)
      : resolver(ioContext),
        ws(ioContext, streamArgs...),
        url(_url),
        callbacks(_callbacks),
        opened(false),
        closing(false),
        finished(false) {}

  void start() override {
    auto self = this->shared_from_this();
    VLOG(1) << "Resolving " << url.host << ":" << url.port;
    resolver.async_resolve(
        url.host, url.port,
        [self](beast::error_code ec, tcp::resolver::results_type results) {
          self->onResolve(ec, results);
        });
  }

  void send(const string& text) override {
    if (closing || finished) {
      VLOG(1) << "Dropping write on a finished connection";
      return;
    }
    writeQueue.push_back(text);
    if (opened && writeQueue.size() == 1) {
      doWrite();
    }
  }

  void close(int code, const string& reason) override {
    callbacks = TransportCallbacks();
    if (closing || finished) {
      return;
    }
    closing = true;
    beast::error_code ignored;
    if (opened) {
      websocket::close_reason closeReason(
          static_cast<websocket::close_code>(code), reason);
      if (writeQueue.empty()) {
        doClose(closeReason);
      } else {
        // Only one write may be outstanding; close once it completes
        pendingClose = closeReason;
      }
    } else {
      resolver.cancel();
      beast::get_lowest_layer(ws).socket().close(ignored);
    }
  }

 protected:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closing) return;
    if (ec) {
      fail("resolve", ec);
      return;
    }
    auto self = this->shared_from_this();
    beast::get_lowest_layer(ws).expires_after(CONNECT_TIMEOUT);
    beast::get_lowest_layer(ws).async_connect(
        results, [self](beast::error_code ec, tcp::endpoint endpoint) {
          self->onConnect(ec);
        });
  }

  void onConnect(beast::error_code ec) {
    if (closing) return;
    if (ec) {
      fail("connect", ec);
      return;
    }
    auto self = this->shared_from_this();
    secureStream(ws, url,
                 [self](beast::error_code ec) { self->onSecured(ec); });
  }

  void onSecured(beast::error_code ec) {
    if (closing) return;
    if (ec) {
      fail("tls handshake", ec);
      return;
    }
    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws.set_option(
        websocket::stream_base::decorator([](websocket::request_type& req) {
          req.set(beast::http::field::user_agent,
                  string("parley/") + PARLEY_VERSION);
        }));
    ws.text(true);
    auto self = this->shared_from_this();
    ws.async_handshake(url.hostHeader(), url.target,
                       [self](beast::error_code ec) { self->onHandshake(ec); });
  }

  void onHandshake(beast::error_code ec) {
    if (closing) return;
    if (ec) {
      fail("handshake", ec);
      return;
    }
    opened = true;
    VLOG(1) << "WebSocket handshake complete";
    if (callbacks.onOpen) {
      callbacks.onOpen();
    }
    if (closing) return;
    doRead();
    if (!writeQueue.empty()) {
      doWrite();
    }
  }

  void doRead() {
    auto self = this->shared_from_this();
    ws.async_read(readBuffer,
                  [self](beast::error_code ec, size_t bytesTransferred) {
                    self->onRead(ec);
                  });
  }

  void onRead(beast::error_code ec) {
    if (closing || finished) return;
    if (ec == websocket::error::closed) {
      auto reason = ws.reason();
      int code = reason.code == websocket::close_code::none
                     ? CLOSE_NO_STATUS
                     : static_cast<int>(reason.code);
      finish(code, string(reason.reason.data(), reason.reason.size()));
      return;
    }
    if (ec) {
      fail("read", ec);
      return;
    }
    string text = beast::buffers_to_string(readBuffer.data());
    readBuffer.consume(readBuffer.size());
    VLOG(2) << "Received frame of " << text.length() << " bytes";
    if (callbacks.onMessage) {
      callbacks.onMessage(text);
    }
    if (closing || finished) return;
    doRead();
  }

  void doWrite() {
    auto self = this->shared_from_this();
    ws.async_write(asio::buffer(writeQueue.front()),
                   [self](beast::error_code ec, size_t bytesTransferred) {
                     self->onWrite(ec);
                   });
  }

  void onWrite(beast::error_code ec) {
    if (finished) return;
    if (closing) {
      if (pendingClose) {
        auto closeReason = *pendingClose;
        pendingClose.reset();
        doClose(closeReason);
      }
      return;
    }
    if (ec) {
      fail("write", ec);
      return;
    }
    writeQueue.pop_front();
    if (!writeQueue.empty()) {
      doWrite();
    }
  }

  void doClose(const websocket::close_reason& closeReason) {
    VLOG(1) << "Sending close frame " << closeReason.code;
    auto self = this->shared_from_this();
    ws.async_close(closeReason, [self](beast::error_code ec) {
      VLOG(1) << "Close handshake finished: " << ec.message();
    });
  }

  void fail(const string& what, beast::error_code ec) {
    STERROR << "WebSocket " << what << " failed: " << ec.message();
    if (callbacks.onError) {
      callbacks.onError(what + ": " + ec.message());
    }
    beast::error_code ignored;
    beast::get_lowest_layer(ws).socket().close(ignored);
    finish(CLOSE_ABNORMAL, ec.message());
  }

  void finish(int code, const string& reason) {
    if (finished) return;
    finished = true;
    writeQueue.clear();
    auto onClose = callbacks.onClose;
    callbacks = TransportCallbacks();
    if (onClose) {
      onClose(code, reason);
    }
  }

  tcp::resolver resolver;
  Stream ws;
  WebSocketUrl url;
  TransportCallbacks callbacks;
  beast::flat_buffer readBuffer;
  /** @brief Frames waiting to be written; the front one is in flight. */
  deque<string> writeQueue;
  optional<websocket::close_reason> pendingClose;
  bool opened;
  bool closing;
  bool finished;
};
}  // namespace

WebSocketTransport::WebSocketTransport(
    asio::io_context& _ioContext, shared_ptr<ssl::context> _sslContext)
    : ioContext(_ioContext), sslContext(_sslContext), closed(false) {}

WebSocketTransport::~WebSocketTransport() {
  if (!closed) {
    close(CLOSE_NORMAL, "");
  }
}

void WebSocketTransport::open(const string& url,
                              const TransportCallbacks& callbacks) {
  WebSocketUrl parsed;
  if (!parseWebSocketUrl(url, &parsed)) {
    // The URL carries the credential, so it is not logged
    STERROR << "Invalid WebSocket URL";
    // Report asynchronously so the caller never re-enters from open()
    std::weak_ptr<WebSocketTransport> weakSelf = shared_from_this();
    asio::post(ioContext, [weakSelf, callbacks]() {
      auto self = weakSelf.lock();
      if (!self || self->closed) {
        return;
      }
      if (callbacks.onError) {
        callbacks.onError("invalid url");
      }
      if (callbacks.onClose) {
        callbacks.onClose(CLOSE_ABNORMAL, "invalid url");
      }
    });
    return;
  }

  if (parsed.secure) {
    session = make_shared<BasicWebSocketSession<TlsStream>>(
        ioContext, parsed, callbacks, *sslContext);
  } else {
    session = make_shared<BasicWebSocketSession<PlainStream>>(
        ioContext, parsed, callbacks);
  }
  session->start();
}

void WebSocketTransport::send(const string& text) {
  if (!session) {
    LOG(WARNING) << "Tried to send on a transport that never opened";
    return;
  }
  session->send(text);
}

void WebSocketTransport::close(int code, const string& reason) {
  closed = true;
  if (session) {
    session->close(code, reason);
  }
}

WebSocketTransportFactory::WebSocketTransportFactory(
    asio::io_context& _ioContext)
    : ioContext(_ioContext),
      sslContext(make_shared<ssl::context>(ssl::context::tls_client)) {
  sslContext->set_default_verify_paths();
  sslContext->set_verify_mode(ssl::verify_peer);
}

shared_ptr<Transport> WebSocketTransportFactory::create() {
  return make_shared<WebSocketTransport>(ioContext, sslContext);
}
}  // namespace parley
