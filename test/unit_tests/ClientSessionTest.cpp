#include "ClientSession.hpp"
#include "ConsoleView.hpp"
#include "FakeTransport.hpp"
#include "ManualEventLoop.hpp"
#include "TestHeaders.hpp"

using namespace parley;

namespace {
class RecordingSession : public ClientSession {
 public:
  using ClientSession::ClientSession;

  vector<string> printed;

 protected:
  void print(const string& line) override { printed.push_back(line); }
};

class RecordingView : public ConsoleView {
 public:
  explicit RecordingView(shared_ptr<ConversationStateStore> _store)
      : ConsoleView(_store) {}

  vector<string> printed;

 protected:
  void print(const string& line) override { printed.push_back(line); }
};

Message historyMessage(const string& id, SenderRole role, const string& text) {
  Message message;
  message.id = id;
  message.senderRole = role;
  message.text = text;
  message.timestamp = "2025-01-01T00:00:00";
  return message;
}

class SessionHarness {
 public:
  SessionHarness()
      : factory(make_shared<FakeTransportFactory>()),
        store(make_shared<ConversationStateStore>()),
        manager(loop, factory, store, "http://localhost:8000"),
        coordinator(manager, store),
        quitCount(0),
        session(manager, coordinator, store, "tok",
                [this](const Identity& identity) {
                  historyRequests.push_back(identity);
                  return optional<vector<Message>>(vector<Message>(
                      {historyMessage("h1", SenderRole::COUNTERPART,
                                      "Welcome")}));
                },
                [this]() { quitCount++; }) {}

  ManualEventLoop loop;
  shared_ptr<FakeTransportFactory> factory;
  shared_ptr<ConversationStateStore> store;
  ConnectionManager manager;
  LifecycleCoordinator coordinator;
  vector<Identity> historyRequests;
  int quitCount;
  RecordingSession session;
};
}  // namespace

TEST_CASE("Joining seeds history and marks read on open", "[ClientSession]") {
  SessionHarness h;
  h.session.join("c1");
  REQUIRE(h.historyRequests.size() == 1);
  REQUIRE(h.historyRequests[0] == Identity("c1", "tok"));
  REQUIRE(h.store->messages().size() == 1);
  REQUIRE(h.factory->created.size() == 1);

  h.factory->last()->serverOpen();
  REQUIRE(h.factory->last()->countSent("mark_read") == 1);
}

TEST_CASE("Counterpart messages are acknowledged while open",
          "[ClientSession]") {
  SessionHarness h;
  h.session.join("c1");
  auto transport = h.factory->last();
  transport->serverOpen();
  REQUIRE(transport->countSent("mark_read") == 1);

  transport->serverSend(json({{"type", "new_message"},
                              {"message",
                               {{"message_id", "m2"},
                                {"sender_id", 12},
                                {"sender_type", "lawyer"},
                                {"text", "Please send the deed"}}}}));
  REQUIRE(h.store->messages().size() == 2);
  REQUIRE(transport->countSent("mark_read") == 2);

  // Our own echoed message needs no receipt
  transport->serverSend(json({{"type", "new_message"},
                              {"message",
                               {{"message_id", "m3"},
                                {"sender_id", 7},
                                {"sender_type", "user"},
                                {"text", "Sending it now"}}}}));
  REQUIRE(h.store->messages().size() == 3);
  REQUIRE(transport->countSent("mark_read") == 2);
}

TEST_CASE("Typed lines become messages", "[ClientSession]") {
  SessionHarness h;
  h.session.join("c1");
  auto transport = h.factory->last();
  transport->serverOpen();

  h.session.handleLine("/typing on");
  h.loop.advance(300);
  h.session.handleLine("  How long does probate take?  ");
  h.session.handleLine("");

  auto frames = transport->sentFrames();
  REQUIRE(frames.size() == 4);
  REQUIRE(frames[0]["type"] == "mark_read");
  REQUIRE(frames[1]["type"] == "typing");
  REQUIRE(frames[1]["is_typing"] == true);
  REQUIRE(frames[2]["type"] == "typing");
  REQUIRE(frames[2]["is_typing"] == false);
  REQUIRE(frames[3]["type"] == "send_message");
  REQUIRE(frames[3]["text"] == "How long does probate take?");
}

TEST_CASE("Commands", "[ClientSession]") {
  SessionHarness h;
  h.session.join("c1");
  auto first = h.factory->last();

  SECTION("Read while connecting") {
    h.session.handleLine("/read");
    REQUIRE(h.session.printed.back() == "! Not connected to chat");
  }

  SECTION("Reconnect") {
    h.session.handleLine("/reconnect");
    REQUIRE(first->closeCalls.size() == 1);
    REQUIRE(h.factory->created.size() == 2);
  }

  SECTION("Switch") {
    first->serverOpen();
    h.session.handleLine("/switch c2");
    REQUIRE(first->closeCalls.size() == 1);
    REQUIRE(h.factory->created.size() == 2);
    REQUIRE(h.coordinator.getIdentity() == Identity("c2", "tok"));
    REQUIRE(h.historyRequests.size() == 2);
    REQUIRE(h.session.getGeneration() == 2);
  }

  SECTION("Usage errors") {
    h.session.handleLine("/typing maybe");
    REQUIRE(h.session.printed.back() == "Usage: /typing on|off");
    h.session.handleLine("/switch");
    REQUIRE(h.session.printed.back() == "Usage: /switch <conversation id>");
    h.session.handleLine("/dance");
    REQUIRE(h.session.printed.back() == "Unknown command /dance, try /help");
  }

  SECTION("Quit") {
    first->serverOpen();
    h.session.handleLine("/quit");
    REQUIRE(h.quitCount == 1);
    REQUIRE(first->closeCalls.size() == 1);
    REQUIRE(h.store->getConnectionState() == ConnectionState::IDLE);

    // Input after quitting is ignored
    h.session.handleLine("/quit");
    h.session.handleLine("hello");
    REQUIRE(h.quitCount == 1);
  }
}

TEST_CASE("Console rendering", "[ConsoleView]") {
  auto store = make_shared<ConversationStateStore>();
  RecordingView view(store);

  store->seedHistory({historyMessage("h1", SenderRole::COUNTERPART, "Hi"),
                      historyMessage("h2", SenderRole::CLIENT, "Hello")});
  REQUIRE(view.printed ==
          vector<string>({"[2025-01-01T00:00:00] lawyer: Hi",
                          "[2025-01-01T00:00:00] you: Hello"}));

  view.printed.clear();
  store->setConnectionState(ConnectionState::CONNECTING);
  store->setConnectionState(ConnectionState::OPEN);
  store->appendMessage(historyMessage("m3", SenderRole::CLIENT, "Question"));
  store->setRemoteTyping(true);
  store->applyReadReceipt({"h2", "m3"}, SenderRole::COUNTERPART);
  store->setError({ChatErrorCode::MAX_RECONNECT_EXCEEDED,
                   "Failed to connect after multiple attempts"});
  REQUIRE(view.printed ==
          vector<string>({"* Connecting...", "* Connected",
                          "[2025-01-01T00:00:00] you: Question",
                          "* lawyer is typing...",
                          "* lawyer read 2 of your messages",
                          "! Failed to connect after multiple attempts",
                          "! Type /reconnect to try again"}));

  view.printed.clear();
  store->reset();
  REQUIRE(view.printed == vector<string>({"* Left conversation"}));

  Message own = historyMessage("m9", SenderRole::CLIENT, "Thanks");
  own.timestamp = "";
  own.readByCounterpart = true;
  REQUIRE(ConsoleView::formatMessage(own) == "you: Thanks (read)");
}
