#include "ChatError.hpp"

namespace parley {
string chatErrorCodeName(ChatErrorCode code) {
  switch (code) {
    case ChatErrorCode::IDENTITY_INCOMPLETE:
      return "IdentityIncomplete";
    case ChatErrorCode::TRANSPORT_ERROR:
      return "TransportError";
    case ChatErrorCode::NOT_CONNECTED:
      return "NotConnected";
    case ChatErrorCode::PROTOCOL_ERROR:
      return "ProtocolError";
    case ChatErrorCode::MAX_RECONNECT_EXCEEDED:
      return "MaxReconnectExceeded";
    case ChatErrorCode::MALFORMED_FRAME:
      return "MalformedFrame";
  }
  return "Unknown";
}
}  // namespace parley
