#include "ConversationStateStore.hpp"

namespace parley {
string connectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::IDLE:
      return "Idle";
    case ConnectionState::CONNECTING:
      return "Connecting";
    case ConnectionState::OPEN:
      return "Open";
    case ConnectionState::CLOSING:
      return "Closing";
    case ConnectionState::CLOSED:
      return "Closed";
  }
  return "Unknown";
}

ConversationStateStore::ConversationStateStore()
    : connectionState(ConnectionState::IDLE),
      remoteTyping(false),
      reconnectAttempt(0),
      nextSubscriptionId(1) {}

void ConversationStateStore::seedHistory(const vector<Message>& history) {
  log.clear();
  index.clear();
  for (const auto& message : history) {
    if (index.find(message.id) != index.end()) {
      VLOG(1) << "Dropping repeated history message " << message.id;
      continue;
    }
    index[message.id] = log.size();
    log.push_back(message);
  }
  VLOG(1) << "Seeded history with " << log.size() << " messages";
  notify(StoreChange::MESSAGES);
}

bool ConversationStateStore::appendMessage(const Message& message) {
  auto it = index.find(message.id);
  if (it != index.end()) {
    Message& existing = log[it->second];
    bool changed = false;
    if (message.readByClient && !existing.readByClient) {
      existing.readByClient = true;
      changed = true;
    }
    if (message.readByCounterpart && !existing.readByCounterpart) {
      existing.readByCounterpart = true;
      changed = true;
    }
    VLOG(1) << "Message " << message.id << " already in the log";
    if (changed) {
      notify(StoreChange::READ_FLAGS);
    }
    return false;
  }
  index[message.id] = log.size();
  log.push_back(message);
  notify(StoreChange::MESSAGES);
  return true;
}

int ConversationStateStore::applyReadReceipt(const vector<string>& ids,
                                             SenderRole reader) {
  int changed = 0;
  for (const auto& id : ids) {
    auto it = index.find(id);
    if (it == index.end()) {
      VLOG(2) << "Read receipt for unknown message " << id;
      continue;
    }
    Message& message = log[it->second];
    bool& flag = reader == SenderRole::CLIENT ? message.readByClient
                                              : message.readByCounterpart;
    if (!flag) {
      flag = true;
      changed++;
    }
  }
  if (changed) {
    notify(StoreChange::READ_FLAGS);
  }
  return changed;
}

void ConversationStateStore::setRemoteTyping(bool typing) {
  if (remoteTyping == typing) {
    return;
  }
  remoteTyping = typing;
  notify(StoreChange::REMOTE_TYPING);
}

void ConversationStateStore::setError(const ChatError& _error) {
  if (error && *error == _error) {
    return;
  }
  error = _error;
  notify(StoreChange::ERROR_STATE);
}

void ConversationStateStore::clearError() {
  if (!error) {
    return;
  }
  error.reset();
  notify(StoreChange::ERROR_STATE);
}

void ConversationStateStore::setConnectionState(ConnectionState state) {
  if (connectionState == state) {
    return;
  }
  LOG(INFO) << "Connection state " << connectionStateName(connectionState)
            << " -> " << connectionStateName(state);
  connectionState = state;
  notify(StoreChange::CONNECTION_STATE);
}

void ConversationStateStore::setReconnectAttempt(int attempt) {
  if (reconnectAttempt == attempt) {
    return;
  }
  reconnectAttempt = attempt;
  notify(StoreChange::RECONNECT_ATTEMPT);
}

void ConversationStateStore::reset() {
  log.clear();
  index.clear();
  connectionState = ConnectionState::IDLE;
  remoteTyping = false;
  error.reset();
  reconnectAttempt = 0;
  notify(StoreChange::RESET);
}

const Message* ConversationStateStore::findMessage(const string& id) const {
  auto it = index.find(id);
  if (it == index.end()) {
    return nullptr;
  }
  return &log[it->second];
}

SubscriptionId ConversationStateStore::subscribe(const Listener& listener) {
  SubscriptionId id = nextSubscriptionId++;
  listeners[id] = listener;
  return id;
}

bool ConversationStateStore::unsubscribe(SubscriptionId id) {
  return listeners.erase(id) > 0;
}

void ConversationStateStore::notify(StoreChange change) {
  // Copy so a listener may unsubscribe itself
  auto current = listeners;
  for (auto& it : current) {
    it.second(change);
  }
}
}  // namespace parley
