#include "ConsoleView.hpp"

namespace parley {
namespace {
int countReadByCounterpart(const vector<Message>& messages) {
  int count = 0;
  for (const auto& message : messages) {
    if (message.senderRole == SenderRole::CLIENT &&
        message.readByCounterpart) {
      count++;
    }
  }
  return count;
}
}  // namespace

ConsoleView::ConsoleView(shared_ptr<ConversationStateStore> _store)
    : store(_store), renderedCount(0), readByCounterpart(0) {
  subscription =
      store->subscribe([this](StoreChange change) { onChange(change); });
}

ConsoleView::~ConsoleView() { store->unsubscribe(subscription); }

string ConsoleView::formatMessage(const Message& message) {
  std::ostringstream ss;
  if (!message.timestamp.empty()) {
    ss << "[" << message.timestamp << "] ";
  }
  if (message.senderRole == SenderRole::CLIENT) {
    ss << "you: " << message.text;
    if (message.readByCounterpart) {
      ss << " (read)";
    }
  } else {
    ss << "lawyer: " << message.text;
  }
  return ss.str();
}

void ConsoleView::onChange(StoreChange change) {
  switch (change) {
    case StoreChange::MESSAGES:
      renderMessages();
      break;
    case StoreChange::READ_FLAGS:
      renderReadReceipts();
      break;
    case StoreChange::REMOTE_TYPING:
      if (store->isRemoteTyping()) {
        print("* lawyer is typing...");
      }
      break;
    case StoreChange::ERROR_STATE: {
      const auto& error = store->getError();
      if (!error) {
        break;
      }
      print("! " + error->message);
      if (error->code == ChatErrorCode::MAX_RECONNECT_EXCEEDED) {
        print("! Type /reconnect to try again");
      }
      break;
    }
    case StoreChange::CONNECTION_STATE:
      switch (store->getConnectionState()) {
        case ConnectionState::CONNECTING:
          print("* Connecting...");
          break;
        case ConnectionState::OPEN:
          print("* Connected");
          break;
        case ConnectionState::CLOSED:
          print("* Disconnected");
          break;
        default:
          break;
      }
      break;
    case StoreChange::RECONNECT_ATTEMPT:
      if (store->getReconnectAttempt() > 0) {
        print("* Reconnecting (attempt " +
              to_string(store->getReconnectAttempt()) + ")");
      }
      break;
    case StoreChange::RESET:
      renderedCount = 0;
      lastRenderedId.clear();
      readByCounterpart = 0;
      print("* Left conversation");
      break;
  }
}

void ConsoleView::renderMessages() {
  const auto& messages = store->messages();
  if (renderedCount > 0 && (renderedCount > messages.size() ||
                            messages[renderedCount - 1].id != lastRenderedId)) {
    // The log was replaced by a history snapshot
    renderedCount = 0;
  }
  for (; renderedCount < messages.size(); renderedCount++) {
    print(formatMessage(messages[renderedCount]));
    lastRenderedId = messages[renderedCount].id;
  }
  readByCounterpart = countReadByCounterpart(messages);
}

void ConsoleView::renderReadReceipts() {
  int count = countReadByCounterpart(store->messages());
  if (count > readByCounterpart) {
    print("* lawyer read " + to_string(count - readByCounterpart) +
          " of your messages");
  }
  readByCounterpart = count;
}

void ConsoleView::print(const string& line) {
  CLOG(INFO, "stdout") << line << endl;
}
}  // namespace parley
