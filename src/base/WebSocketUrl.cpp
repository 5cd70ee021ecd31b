#include "WebSocketUrl.hpp"

namespace parley {
namespace {
bool startsWith(const string& s, const string& prefix) {
  return s.compare(0, prefix.length(), prefix) == 0;
}

bool isUnreserved(unsigned char c) {
  return isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}
}  // namespace

string WebSocketUrl::hostHeader() const {
  string h = host;
  if (h.find(':') != string::npos) {
    // ipv6 literal
    h = "[" + h + "]";
  }
  if ((secure && port != "443") || (!secure && port != "80")) {
    h += ":" + port;
  }
  return h;
}

string toWebSocketBase(const string& apiBaseUrl) {
  string base = apiBaseUrl;
  if (startsWith(base, "https://")) {
    replace(base, "https://", "wss://");
  } else if (startsWith(base, "http://")) {
    replace(base, "http://", "ws://");
  }
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base;
}

string percentEncode(const string& s) {
  static const char hex[] = "0123456789ABCDEF";
  string out;
  out.reserve(s.length());
  for (unsigned char c : s) {
    if (isUnreserved(c)) {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

string composeConversationUrl(const string& apiBaseUrl,
                              const string& conversationId,
                              const string& credential) {
  return toWebSocketBase(apiBaseUrl) + CONVERSATION_WS_PATH +
         percentEncode(conversationId) + "?token=" + percentEncode(credential);
}

bool parseWebSocketUrl(const string& url, WebSocketUrl* result) {
  string remaining;
  if (startsWith(url, "wss://")) {
    result->secure = true;
    remaining = url.substr(6);
  } else if (startsWith(url, "ws://")) {
    result->secure = false;
    remaining = url.substr(5);
  } else {
    return false;
  }

  auto slash = remaining.find_first_of("/?");
  string authority = remaining.substr(0, slash);
  if (slash == string::npos) {
    result->target = "/";
  } else {
    result->target = remaining.substr(slash);
    if (result->target[0] == '?') {
      result->target = "/" + result->target;
    }
  }

  string portString;
  if (!authority.empty() && authority[0] == '[') {
    // Bracketed ipv6 literal: [::1] or [::1]:port
    auto closeBracket = authority.find(']');
    if (closeBracket == string::npos) {
      return false;
    }
    result->host = authority.substr(1, closeBracket - 1);
    if (closeBracket + 1 < authority.length()) {
      if (authority[closeBracket + 1] != ':') {
        return false;
      }
      portString = authority.substr(closeBracket + 2);
    }
  } else {
    auto colon = authority.find(':');
    result->host = authority.substr(0, colon);
    if (colon != string::npos) {
      portString = authority.substr(colon + 1);
    }
  }

  if (result->host.empty()) {
    return false;
  }
  if (portString.empty()) {
    result->port = result->secure ? "443" : "80";
  } else {
    if (!std::all_of(portString.begin(), portString.end(),
                     [](unsigned char c) { return isdigit(c); })) {
      return false;
    }
    result->port = portString;
  }
  return true;
}
}  // namespace parley
