#include "ConnectionManager.hpp"
#include "FakeTransport.hpp"
#include "ManualEventLoop.hpp"
#include "TestHeaders.hpp"

using namespace parley;

namespace {
json newMessageFrame(const string& id, const string& senderType = "lawyer",
                     const string& text = "hello") {
  return {{"type", "new_message"},
          {"message",
           {{"message_id", id},
            {"sender_id", senderType == "lawyer" ? 12 : 7},
            {"sender_type", senderType},
            {"text", text},
            {"timestamp", "2025-01-01T00:00:00Z"},
            {"read_by_user", false},
            {"read_by_lawyer", false}}}};
}

class ManagerHarness {
 public:
  ManagerHarness()
      : factory(make_shared<FakeTransportFactory>()),
        store(make_shared<ConversationStateStore>()),
        manager(loop, factory, store, "http://localhost:8000") {}

  /** @brief Connects and completes the handshake. */
  shared_ptr<FakeTransport> open(const Identity& identity) {
    REQUIRE(manager.connect(identity));
    auto transport = factory->last();
    transport->serverOpen();
    REQUIRE(manager.getState() == ConnectionState::OPEN);
    return transport;
  }

  ManualEventLoop loop;
  shared_ptr<FakeTransportFactory> factory;
  shared_ptr<ConversationStateStore> store;
  ConnectionManager manager;
};

const Identity ALICE("c1", "t1");
const Identity BOB("c2", "t2");
}  // namespace

TEST_CASE("Incomplete identities never connect", "[ConnectionManager]") {
  ManagerHarness h;
  REQUIRE_FALSE(h.manager.connect(Identity("c1", "")));
  REQUIRE_FALSE(h.manager.connect(Identity("", "t1")));
  REQUIRE_FALSE(h.manager.connect(Identity()));
  REQUIRE(h.factory->created.empty());
  REQUIRE(h.manager.getState() == ConnectionState::IDLE);
  REQUIRE_FALSE(h.store->getError().has_value());
}

TEST_CASE("Connect opens the composed endpoint", "[ConnectionManager]") {
  ManagerHarness h;
  REQUIRE(h.manager.connect(ALICE));
  REQUIRE(h.factory->created.size() == 1);
  auto transport = h.factory->last();
  REQUIRE(transport->url ==
          "ws://localhost:8000/api/v1/ws/conversation/c1?token=t1");
  REQUIRE(h.manager.getState() == ConnectionState::CONNECTING);
  REQUIRE(h.store->getConnectionState() == ConnectionState::CONNECTING);

  SECTION("Connecting again for the same identity is a no-op") {
    REQUIRE(h.manager.connect(ALICE));
    transport->serverOpen();
    REQUIRE(h.manager.connect(ALICE));
    REQUIRE(h.factory->created.size() == 1);
    REQUIRE(transport->closeCalls.empty());
    REQUIRE(h.store->isConnected());
  }

  SECTION("Another identity replaces the connection") {
    transport->serverOpen();
    REQUIRE(h.manager.connect(BOB));
    REQUIRE(transport->closeCalls.size() == 1);
    REQUIRE(transport->closeCalls[0].first == CLOSE_NORMAL);
    REQUIRE(h.factory->created.size() == 2);
    REQUIRE(h.factory->last()->url ==
            "ws://localhost:8000/api/v1/ws/conversation/c2?token=t2");
    REQUIRE(h.manager.getIdentity() == BOB);
    REQUIRE(h.manager.getState() == ConnectionState::CONNECTING);
  }
}

TEST_CASE("Sending requires an open connection", "[ConnectionManager]") {
  ManagerHarness h;

  SECTION("Before connecting") {
    REQUIRE_FALSE(h.manager.send("hi"));
    REQUIRE(h.store->getError()->code == ChatErrorCode::NOT_CONNECTED);
    REQUIRE(h.store->getError()->message == "Not connected to chat");
  }

  SECTION("While connecting") {
    h.manager.connect(ALICE);
    REQUIRE_FALSE(h.manager.send("hi"));
    REQUIRE_FALSE(h.manager.markRead());
    REQUIRE(h.factory->last()->sent.empty());
  }

  SECTION("After the connection closed") {
    auto transport = h.open(ALICE);
    transport->serverClose(CLOSE_ABNORMAL);
    REQUIRE(h.manager.getState() == ConnectionState::CLOSED);
    REQUIRE_FALSE(h.manager.send("hi"));
    REQUIRE(h.store->getError()->code == ChatErrorCode::NOT_CONNECTED);
    REQUIRE(transport->sent.empty());
  }

  SECTION("When open") {
    auto transport = h.open(ALICE);
    REQUIRE(h.manager.send("  Hello there \n"));
    REQUIRE_FALSE(h.manager.send("   "));
    REQUIRE(h.manager.markRead());
    auto frames = transport->sentFrames();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0]["type"] == "send_message");
    REQUIRE(frames[0]["text"] == "Hello there");
    REQUIRE(frames[1]["type"] == "mark_read");
    REQUIRE_FALSE(h.store->getError().has_value());
  }
}

TEST_CASE("Mark read while closed does not record an error",
          "[ConnectionManager]") {
  ManagerHarness h;
  REQUIRE_FALSE(h.manager.markRead());
  REQUIRE_FALSE(h.store->getError().has_value());
}

TEST_CASE("Typing goes through the throttle", "[ConnectionManager]") {
  ManagerHarness h;
  h.manager.signalTyping(true);
  REQUIRE(h.loop.pendingTimerCount() == 0);

  auto transport = h.open(ALICE);
  h.manager.signalTyping(true);
  h.manager.signalTyping(true);
  h.loop.advance(299);
  REQUIRE(transport->countSent("typing") == 0);
  h.loop.advance(1);
  auto frames = transport->sentFrames();
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0]["type"] == "typing");
  REQUIRE(frames[0]["is_typing"] == true);

  h.manager.signalTyping(false);
  h.manager.signalTyping(false);
  REQUIRE(transport->countSent("typing") == 2);
  REQUIRE(transport->sentFrames().back()["is_typing"] == false);
}

TEST_CASE("Inbound frames update the store", "[ConnectionManager]") {
  ManagerHarness h;
  auto transport = h.open(ALICE);

  SECTION("Duplicate messages appear once, in arrival order") {
    transport->serverSend(newMessageFrame("m1"));
    transport->serverSend(newMessageFrame("m2", "user"));
    transport->serverSend(newMessageFrame("m1", "lawyer", "replayed"));
    transport->serverSend(newMessageFrame("m3"));
    transport->serverSend(newMessageFrame("m2", "user"));

    const auto& messages = h.store->messages();
    REQUIRE(messages.size() == 3);
    REQUIRE(messages[0].id == "m1");
    REQUIRE(messages[0].text == "hello");
    REQUIRE(messages[1].id == "m2");
    REQUIRE(messages[1].senderRole == SenderRole::CLIENT);
    REQUIRE(messages[2].id == "m3");
  }

  SECTION("Typing indicator") {
    transport->serverSend(json({{"type", "typing_indicator"},
                                {"user_type", "lawyer"},
                                {"is_typing", true}}));
    REQUIRE(h.store->isRemoteTyping());
    transport->serverSend(json({{"type", "typing_indicator"},
                                {"user_type", "lawyer"},
                                {"is_typing", false}}));
    REQUIRE_FALSE(h.store->isRemoteTyping());
  }

  SECTION("Read receipts patch matching entries") {
    transport->serverSend(newMessageFrame("m1", "user"));
    transport->serverSend(newMessageFrame("m2", "user"));
    json receipt = {{"type", "read_receipt"},
                    {"reader_type", "lawyer"},
                    {"message_ids", {"m1", "m2", "unknown"}}};
    transport->serverSend(receipt);
    transport->serverSend(receipt);
    REQUIRE(h.store->findMessage("m1")->readByCounterpart);
    REQUIRE(h.store->findMessage("m2")->readByCounterpart);
    REQUIRE_FALSE(h.store->findMessage("m1")->readByClient);
    REQUIRE(h.store->messages().size() == 2);

    transport->serverSend(json({{"type", "read_receipt"},
                                {"reader_type", "admin"},
                                {"message_ids", {"m1"}}}));
    REQUIRE_FALSE(h.store->findMessage("m1")->readByClient);
  }

  SECTION("Server errors do not close the connection") {
    transport->serverSend(json({{"type", "error"}, {"error", "Rate limited"}}));
    REQUIRE(h.store->getError()->code == ChatErrorCode::PROTOCOL_ERROR);
    REQUIRE(h.store->getError()->message == "Rate limited");
    REQUIRE(h.manager.getState() == ConnectionState::OPEN);
    REQUIRE(transport->closeCalls.empty());

    transport->serverSend(json({{"type", "error"}}));
    REQUIRE(h.store->getError()->message == "Unknown error");
  }

  SECTION("Malformed and unknown frames are dropped") {
    transport->serverSend(string("{not json"));
    transport->serverSend(json({{"type", "new_message"}}));
    transport->serverSend(json({{"type", "presence"}, {"online", true}}));
    transport->serverSend(json({{"type", "connection_established"}}));
    transport->serverSend(newMessageFrame("m1"));
    REQUIRE(h.store->messages().size() == 1);
    REQUIRE_FALSE(h.store->getError().has_value());
    REQUIRE(h.manager.getState() == ConnectionState::OPEN);
  }
}

TEST_CASE("Abnormal closes back off and reconnect", "[ConnectionManager]") {
  ManagerHarness h;
  auto first = h.open(ALICE);
  first->serverSend(json({{"type", "typing_indicator"}, {"is_typing", true}}));

  first->serverClose(CLOSE_ABNORMAL, "");
  REQUIRE(h.manager.getState() == ConnectionState::CLOSED);
  REQUIRE_FALSE(h.store->isRemoteTyping());
  REQUIRE(h.manager.getAttempt() == 1);
  REQUIRE(h.store->getReconnectAttempt() == 1);
  REQUIRE(h.manager.hasPendingReconnect());
  REQUIRE(h.loop.nextDeadline() == 1000);

  h.loop.advance(999);
  REQUIRE(h.factory->created.size() == 1);
  h.loop.advance(1);
  REQUIRE(h.factory->created.size() == 2);
  REQUIRE(h.manager.getState() == ConnectionState::CONNECTING);

  h.factory->last()->serverClose(CLOSE_ABNORMAL);
  REQUIRE(h.manager.getAttempt() == 2);
  REQUIRE(h.loop.nextDeadline() == h.loop.now() + 2000);
  h.loop.advance(2000);
  REQUIRE(h.factory->created.size() == 3);

  h.factory->last()->serverOpen();
  REQUIRE(h.manager.getAttempt() == 0);
  REQUIRE(h.store->getReconnectAttempt() == 0);
  REQUIRE(h.store->isConnected());
}

TEST_CASE("Retries stop after the last attempt", "[ConnectionManager]") {
  ManagerHarness h;
  h.manager.connect(ALICE);
  for (int i = 0; i < 5; i++) {
    h.factory->last()->serverClose(CLOSE_ABNORMAL);
    REQUIRE(h.manager.hasPendingReconnect());
    h.loop.advance(30000);
  }
  REQUIRE(h.factory->created.size() == 6);
  REQUIRE(h.manager.getAttempt() == 5);

  h.factory->last()->serverClose(CLOSE_ABNORMAL);
  REQUIRE_FALSE(h.manager.hasPendingReconnect());
  REQUIRE(h.store->getError()->code == ChatErrorCode::MAX_RECONNECT_EXCEEDED);
  REQUIRE(h.store->getError()->message ==
          "Failed to connect after multiple attempts");
  h.loop.advance(600000);
  REQUIRE(h.factory->created.size() == 6);

  SECTION("A manual reconnect starts over immediately") {
    REQUIRE(h.manager.reconnect());
    REQUIRE(h.factory->created.size() == 7);
    REQUIRE(h.manager.getAttempt() == 0);
    REQUIRE_FALSE(h.store->getError().has_value());
    REQUIRE(h.manager.getIdentity() == ALICE);
    h.factory->last()->serverOpen();
    REQUIRE(h.store->isConnected());
  }
}

TEST_CASE("Normal closure is final", "[ConnectionManager]") {
  ManagerHarness h;
  auto transport = h.open(ALICE);
  transport->serverClose(CLOSE_NORMAL, "bye");
  REQUIRE(h.manager.getState() == ConnectionState::CLOSED);
  REQUIRE_FALSE(h.manager.hasPendingReconnect());
  REQUIRE_FALSE(h.store->getError().has_value());
}

TEST_CASE("Transport errors are reported without a state change",
          "[ConnectionManager]") {
  ManagerHarness h;
  h.manager.connect(ALICE);
  auto transport = h.factory->last();
  transport->serverError("connection refused");
  REQUIRE(h.store->getError()->code == ChatErrorCode::TRANSPORT_ERROR);
  REQUIRE(h.store->getError()->message == "Connection error occurred");
  REQUIRE(h.manager.getState() == ConnectionState::CONNECTING);

  transport->serverClose(CLOSE_ABNORMAL);
  REQUIRE(h.manager.hasPendingReconnect());
  h.loop.advance(1000);
  h.factory->last()->serverOpen();
  REQUIRE_FALSE(h.store->getError().has_value());
}

TEST_CASE("Disconnect closes normally and stops retrying",
          "[ConnectionManager]") {
  ManagerHarness h;

  SECTION("From open") {
    auto transport = h.open(ALICE);
    vector<ConnectionState> states;
    h.store->subscribe([&](StoreChange change) {
      if (change == StoreChange::CONNECTION_STATE) {
        states.push_back(h.store->getConnectionState());
      }
    });
    h.manager.disconnect();
    REQUIRE(transport->closeCalls.size() == 1);
    REQUIRE(transport->closeCalls[0] ==
            make_pair(CLOSE_NORMAL, string("User disconnected")));
    REQUIRE(states == vector<ConnectionState>({ConnectionState::CLOSING,
                                               ConnectionState::CLOSED}));

    h.manager.disconnect();
    REQUIRE(transport->closeCalls.size() == 1);
    REQUIRE_FALSE(h.manager.send("hi"));
    h.loop.advance(60000);
    REQUIRE(h.factory->created.size() == 1);
  }

  SECTION("With a reconnect pending") {
    auto transport = h.open(ALICE);
    transport->serverClose(CLOSE_ABNORMAL);
    REQUIRE(h.manager.hasPendingReconnect());
    h.manager.disconnect();
    REQUIRE_FALSE(h.manager.hasPendingReconnect());
    REQUIRE(h.manager.getAttempt() == 0);
    h.loop.advance(60000);
    REQUIRE(h.factory->created.size() == 1);
    REQUIRE(transport->closeCalls.empty());
  }

  SECTION("Dedup set is cleared") {
    auto transport = h.open(ALICE);
    transport->serverSend(newMessageFrame("m1"));
    REQUIRE(h.manager.getDeduplicator().seen("m1"));
    h.manager.disconnect();
    REQUIRE_FALSE(h.manager.getDeduplicator().seen("m1"));
  }
}

TEST_CASE("Closing cancels a pending typing signal", "[ConnectionManager]") {
  ManagerHarness h;
  auto transport = h.open(ALICE);
  h.manager.signalTyping(true);
  transport->serverClose(CLOSE_ABNORMAL);
  h.loop.advance(999);
  REQUIRE(transport->countSent("typing") == 0);
  REQUIRE_FALSE(h.manager.getTypingThrottle().hasPendingSignal());
}

TEST_CASE("Stale timers and callbacks are ignored", "[ConnectionManager]") {
  ManagerHarness h;

  SECTION("Reconnect timer of a replaced identity") {
    auto transport = h.open(ALICE);
    transport->serverClose(CLOSE_ABNORMAL);
    REQUIRE(h.manager.connect(BOB));
    REQUIRE(h.manager.getAttempt() == 0);
    h.loop.advance(60000);
    REQUIRE(h.factory->created.size() == 2);
    REQUIRE(h.manager.getIdentity() == BOB);
  }

  SECTION("Events from a replaced transport") {
    auto transport = h.open(ALICE);
    TransportCallbacks oldCallbacks = transport->callbacks;
    h.manager.connect(BOB);
    oldCallbacks.onMessage(newMessageFrame("m1").dump());
    oldCallbacks.onClose(CLOSE_ABNORMAL, "");
    REQUIRE(h.store->messages().empty());
    REQUIRE_FALSE(h.manager.hasPendingReconnect());
    REQUIRE(h.manager.getState() == ConnectionState::CONNECTING);
  }
}
