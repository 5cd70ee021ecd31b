#include "ClientSession.hpp"

namespace parley {
ClientSession::ClientSession(ConnectionManager& _manager,
                             LifecycleCoordinator& _coordinator,
                             shared_ptr<ConversationStateStore> _store,
                             const string& _token,
                             HistoryLoader _historyLoader,
                             function<void()> _onQuit)
    : manager(_manager),
      coordinator(_coordinator),
      store(_store),
      token(_token),
      historyLoader(_historyLoader),
      onQuit(_onQuit),
      generation(0),
      quitting(false) {
  // Acknowledge everything on screen whenever we (re)connect, and each
  // counterpart message that arrives while connected
  subscription = store->subscribe([this](StoreChange change) {
    if (!store->isConnected()) {
      return;
    }
    if (change == StoreChange::CONNECTION_STATE) {
      manager.markRead();
    } else if (change == StoreChange::MESSAGES && !store->messages().empty()) {
      const Message& newest = store->messages().back();
      if (newest.senderRole == SenderRole::COUNTERPART &&
          !newest.readByClient) {
        manager.markRead();
      }
    }
  });
}

ClientSession::~ClientSession() { store->unsubscribe(subscription); }

void ClientSession::join(const string& conversationId) {
  Identity identity(conversationId, token);
  generation = coordinator.bind(identity);
  if (!historyLoader || !identity.isComplete()) {
    return;
  }
  auto history = historyLoader(identity);
  if (history) {
    store->seedHistory(*history);
  } else {
    print("! Could not load earlier messages");
  }
}

void ClientSession::leave() {
  if (generation > 0) {
    coordinator.unbind(generation);
  }
}

void ClientSession::handleLine(const string& rawLine) {
  string line = trim(rawLine);
  if (line.empty() || quitting) {
    return;
  }
  if (line[0] == '/') {
    vector<string> tokens;
    for (const auto& part : split(line, ' ')) {
      if (!part.empty()) {
        tokens.push_back(part);
      }
    }
    handleCommand(tokens);
    return;
  }
  manager.signalTyping(false);
  manager.send(line);
}

void ClientSession::handleCommand(const vector<string>& tokens) {
  const string& command = tokens[0];
  if (command == "/quit") {
    quitting = true;
    leave();
    if (onQuit) {
      onQuit();
    }
  } else if (command == "/read") {
    if (!manager.markRead()) {
      print("! Not connected to chat");
    }
  } else if (command == "/reconnect") {
    if (!manager.reconnect()) {
      print("! Nothing to reconnect to");
    }
  } else if (command == "/typing") {
    if (tokens.size() == 2 && (tokens[1] == "on" || tokens[1] == "off")) {
      manager.signalTyping(tokens[1] == "on");
    } else {
      print("Usage: /typing on|off");
    }
  } else if (command == "/switch") {
    if (tokens.size() == 2) {
      join(tokens[1]);
    } else {
      print("Usage: /switch <conversation id>");
    }
  } else if (command == "/help") {
    print(
        "Commands:\n"
        "  /read                 mark the conversation as read\n"
        "  /reconnect            reconnect now\n"
        "  /typing on|off        send a typing signal\n"
        "  /switch <id>          join another conversation\n"
        "  /quit                 leave and exit");
  } else {
    print("Unknown command " + command + ", try /help");
  }
}

void ClientSession::print(const string& line) {
  CLOG(INFO, "stdout") << line << endl;
}
}  // namespace parley
