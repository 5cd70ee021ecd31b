#include "ConnectionManager.hpp"

#include "WebSocketUrl.hpp"

namespace parley {
namespace {
const char* USER_DISCONNECTED = "User disconnected";
}

ConnectionManager::ConnectionManager(
    EventLoop& _loop, shared_ptr<TransportFactory> _transportFactory,
    shared_ptr<ConversationStateStore> _store, const string& _apiBaseUrl,
    const ReconnectPolicy& _policy, std::chrono::milliseconds typingDebounce,
    std::chrono::milliseconds typingIdleStop)
    : loop(_loop),
      transportFactory(_transportFactory),
      store(_store),
      apiBaseUrl(_apiBaseUrl),
      policy(_policy),
      typingThrottle(_loop, typingDebounce, typingIdleStop),
      transportSerial(0),
      state(ConnectionState::IDLE),
      attempt(0),
      reconnectTimer(NO_TIMER) {}

ConnectionManager::~ConnectionManager() {
  cancelReconnect();
  typingThrottle.reset();
  if (transport) {
    transportSerial++;
    transport->close(CLOSE_NORMAL, USER_DISCONNECTED);
    transport.reset();
  }
}

bool ConnectionManager::connect(const Identity& identity) {
  if (!identity.isComplete()) {
    LOG(INFO) << "Not connecting, identity is incomplete: " << identity;
    return false;
  }
  if (transport && identity == boundIdentity &&
      (state == ConnectionState::OPEN ||
       state == ConnectionState::CONNECTING)) {
    VLOG(1) << "Already " << connectionStateName(state) << " for "
            << identity;
    return true;
  }
  if (identity != boundIdentity) {
    if (transport) {
      LOG(INFO) << "Identity changed, closing connection for "
                << boundIdentity;
      closeTransport(CLOSE_NORMAL, USER_DISCONNECTED);
    }
    deduplicator.reset();
    typingThrottle.reset();
    setAttempt(0);
  } else if (transport) {
    closeTransport(CLOSE_NORMAL, USER_DISCONNECTED);
  }
  cancelReconnect();
  boundIdentity = identity;
  openTransport();
  return true;
}

void ConnectionManager::disconnect() {
  cancelReconnect();
  typingThrottle.reset();
  deduplicator.reset();
  setAttempt(0);
  if (transport) {
    setState(ConnectionState::CLOSING);
    closeTransport(CLOSE_NORMAL, USER_DISCONNECTED);
  }
  if (state != ConnectionState::IDLE) {
    setState(ConnectionState::CLOSED);
  }
  store->setRemoteTyping(false);
  if (!boundIdentity.isEmpty()) {
    LOG(INFO) << "Disconnected from " << boundIdentity;
  }
  boundIdentity = Identity();
}

void ConnectionManager::reset() {
  disconnect();
  setState(ConnectionState::IDLE);
}

bool ConnectionManager::send(const string& text) {
  if (state != ConnectionState::OPEN || !transport) {
    LOG(WARNING) << "Cannot send while " << connectionStateName(state);
    store->setError({ChatErrorCode::NOT_CONNECTED, "Not connected to chat"});
    return false;
  }
  string trimmed = trim(text);
  if (trimmed.empty()) {
    VLOG(1) << "Ignoring empty message";
    return false;
  }
  VLOG(1) << "Sending message (" << trimmed.size() << " bytes)";
  transport->send(FrameCodec::encodeSendMessage(trimmed));
  return true;
}

void ConnectionManager::signalTyping(bool isTyping) {
  if (state != ConnectionState::OPEN) {
    VLOG(3) << "Dropping typing signal while " << connectionStateName(state);
    return;
  }
  typingThrottle.signal(isTyping,
                        [this](bool typing) { sendTyping(typing); });
}

bool ConnectionManager::markRead() {
  if (state != ConnectionState::OPEN || !transport) {
    VLOG(1) << "Not marking read while " << connectionStateName(state);
    return false;
  }
  VLOG(1) << "Sending mark_read";
  transport->send(FrameCodec::encodeMarkRead());
  return true;
}

bool ConnectionManager::reconnect() {
  Identity identity = boundIdentity;
  if (!identity.isComplete()) {
    LOG(INFO) << "Nothing to reconnect to";
    return false;
  }
  LOG(INFO) << "Manual reconnect requested for " << identity;
  disconnect();
  store->clearError();
  return connect(identity);
}

void ConnectionManager::openTransport() {
  transport = transportFactory->create();
  uint64_t serial = ++transportSerial;
  setState(ConnectionState::CONNECTING);
  LOG(INFO) << "Connecting to " << boundIdentity << " (attempt " << attempt
            << ")";

  TransportCallbacks callbacks;
  callbacks.onOpen = [this, serial]() { handleOpen(serial); };
  callbacks.onMessage = [this, serial](const string& text) {
    handleMessage(serial, text);
  };
  callbacks.onError = [this, serial](const string& description) {
    handleError(serial, description);
  };
  callbacks.onClose = [this, serial](int code, const string& reason) {
    handleClose(serial, code, reason);
  };
  transport->open(composeConversationUrl(apiBaseUrl,
                                         boundIdentity.conversationId,
                                         boundIdentity.credential),
                  callbacks);
}

void ConnectionManager::closeTransport(int code, const string& reason) {
  transportSerial++;
  VLOG(1) << "Closing transport with code " << code;
  transport->close(code, reason);
  releaseTransport();
}

void ConnectionManager::releaseTransport() {
  // We may be inside one of its callbacks
  shared_ptr<Transport> released = transport;
  transport.reset();
  loop.post([released]() {});
}

void ConnectionManager::handleOpen(uint64_t serial) {
  if (serial != transportSerial) {
    VLOG(1) << "Ignoring open from a stale transport";
    return;
  }
  setState(ConnectionState::OPEN);
  setAttempt(0);
  store->clearError();
}

void ConnectionManager::handleMessage(uint64_t serial, const string& text) {
  if (serial != transportSerial) {
    VLOG(1) << "Ignoring frame from a stale transport";
    return;
  }
  VLOG(2) << "Received frame: " << text;
  try {
    dispatchFrame(FrameCodec::decodeInbound(text));
  } catch (const MalformedFrameError& mfe) {
    LOG(WARNING) << "Dropping malformed frame: " << mfe.what();
  }
}

void ConnectionManager::handleError(uint64_t serial,
                                    const string& description) {
  if (serial != transportSerial) {
    return;
  }
  LOG(ERROR) << "Transport error: " << description;
  store->setError(
      {ChatErrorCode::TRANSPORT_ERROR, "Connection error occurred"});
}

void ConnectionManager::handleClose(uint64_t serial, int code,
                                    const string& reason) {
  if (serial != transportSerial) {
    VLOG(1) << "Ignoring close from a stale transport";
    return;
  }
  LOG(INFO) << "Connection closed with code " << code
            << (reason.empty() ? "" : " (" + reason + ")");
  transportSerial++;
  releaseTransport();
  setState(ConnectionState::CLOSED);
  store->setRemoteTyping(false);
  typingThrottle.reset();

  if (policy.shouldRetry(attempt, code)) {
    scheduleReconnect();
  } else if (code != CLOSE_NORMAL) {
    LOG(WARNING) << "Giving up after " << attempt << " reconnect attempts";
    store->setError({ChatErrorCode::MAX_RECONNECT_EXCEEDED,
                     "Failed to connect after multiple attempts"});
  }
}

void ConnectionManager::dispatchFrame(const InboundFrame& frame) {
  switch (frame.type) {
    case InboundFrameType::CONNECTION_ESTABLISHED:
      LOG(INFO) << "Server confirmed the connection";
      break;
    case InboundFrameType::NEW_MESSAGE:
      if (deduplicator.seen(frame.message.id)) {
        VLOG(1) << "Dropping duplicate message " << frame.message.id;
        break;
      }
      deduplicator.markSeen(frame.message.id);
      store->appendMessage(frame.message);
      break;
    case InboundFrameType::TYPING_INDICATOR:
      store->setRemoteTyping(frame.isTyping);
      break;
    case InboundFrameType::READ_RECEIPT: {
      if (!frame.role) {
        LOG(WARNING) << "Ignoring read receipt from unknown role '"
                     << frame.roleName << "'";
        break;
      }
      int changed = store->applyReadReceipt(frame.messageIds, *frame.role);
      VLOG(1) << changed << " messages newly read by "
              << senderRoleName(*frame.role);
      break;
    }
    case InboundFrameType::SERVER_ERROR: {
      string message = frame.error.empty() ? "Unknown error" : frame.error;
      LOG(WARNING) << "Server reported an error: " << message;
      store->setError({ChatErrorCode::PROTOCOL_ERROR, message});
      break;
    }
    case InboundFrameType::UNKNOWN:
      LOG(WARNING) << "Ignoring frame of unknown type '" << frame.typeName
                   << "'";
      break;
  }
}

void ConnectionManager::scheduleReconnect() {
  auto delay = policy.nextDelay(attempt);
  setAttempt(attempt + 1);
  Identity target = boundIdentity;
  LOG(INFO) << "Reconnecting in " << delay.count() << "ms (attempt "
            << attempt << " of " << policy.getMaxAttempts() << ")";
  reconnectTimer = loop.runAfter(delay, [this, target]() {
    reconnectTimer = NO_TIMER;
    if (target != boundIdentity) {
      VLOG(1) << "Skipping reconnect for a superseded identity";
      return;
    }
    connect(target);
  });
}

void ConnectionManager::cancelReconnect() {
  if (reconnectTimer != NO_TIMER) {
    VLOG(3) << "Cancelling pending reconnect";
    loop.cancel(reconnectTimer);
    reconnectTimer = NO_TIMER;
  }
}

void ConnectionManager::setState(ConnectionState newState) {
  state = newState;
  store->setConnectionState(newState);
}

void ConnectionManager::setAttempt(int newAttempt) {
  attempt = newAttempt;
  store->setReconnectAttempt(newAttempt);
}

void ConnectionManager::sendTyping(bool isTyping) {
  if (state != ConnectionState::OPEN || !transport) {
    return;
  }
  VLOG(1) << "Sending typing=" << (isTyping ? "true" : "false");
  transport->send(FrameCodec::encodeTyping(isTyping));
}
}  // namespace parley
