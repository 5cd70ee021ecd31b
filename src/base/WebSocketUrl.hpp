#ifndef __PARLEY_WEB_SOCKET_URL__
#define __PARLEY_WEB_SOCKET_URL__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Parsed components of a `ws://` or `wss://` URL.
 */
struct WebSocketUrl {
  bool secure = false;
  /** @brief Host without brackets, used for DNS and SNI. */
  string host;
  string port;
  /** @brief Path plus query, always starting with '/'. */
  string target;

  /** @brief Value for the HTTP Host header (brackets and port as needed). */
  string hostHeader() const;
};

/**
 * @brief Maps the REST API scheme to its WebSocket counterpart
 * (`http`->`ws`, `https`->`wss`). Other schemes are returned unchanged.
 */
string toWebSocketBase(const string& apiBaseUrl);

/**
 * @brief Percent-encodes every byte outside the RFC 3986 unreserved set.
 */
string percentEncode(const string& s);

/**
 * @brief Builds the conversation endpoint
 * `{ws}://{host}/api/v1/ws/conversation/{id}?token={credential}`.
 */
string composeConversationUrl(const string& apiBaseUrl,
                              const string& conversationId,
                              const string& credential);

/**
 * @brief Splits a WebSocket URL.
 * @return false when the scheme is not ws/wss or the host is missing.
 */
bool parseWebSocketUrl(const string& url, WebSocketUrl* result);
}  // namespace parley

#endif  // __PARLEY_WEB_SOCKET_URL__
