#ifndef __PARLEY_CLIENT_SESSION__
#define __PARLEY_CLIENT_SESSION__

#include "ConnectionManager.hpp"
#include "ConversationStateStore.hpp"
#include "Headers.hpp"
#include "LifecycleCoordinator.hpp"

namespace parley {
/**
 * @brief Glue between typed input lines and the chat components of the
 * `parley` client.
 *
 * Runs on the event loop thread.
 */
class ClientSession {
 public:
  typedef function<optional<vector<Message>>(const Identity&)> HistoryLoader;

  /**
   * @param _historyLoader May be empty, in which case no history is loaded.
   * @param _onQuit Invoked once when the user asks to leave.
   */
  ClientSession(ConnectionManager& _manager,
                LifecycleCoordinator& _coordinator,
                shared_ptr<ConversationStateStore> _store,
                const string& _token, HistoryLoader _historyLoader,
                function<void()> _onQuit);

  virtual ~ClientSession();

  /**
   * @brief Binds the conversation and seeds its history.
   */
  void join(const string& conversationId);

  /**
   * @brief Leaves the current conversation, if any.
   */
  void leave();

  /**
   * @brief Runs a slash command or sends the line as a message.
   */
  void handleLine(const string& line);

  inline LifecycleCoordinator::Generation getGeneration() const {
    return generation;
  }

 protected:
  ConnectionManager& manager;
  LifecycleCoordinator& coordinator;
  shared_ptr<ConversationStateStore> store;
  string token;
  HistoryLoader historyLoader;
  function<void()> onQuit;
  LifecycleCoordinator::Generation generation;
  SubscriptionId subscription;
  bool quitting;

  void handleCommand(const vector<string>& tokens);

  virtual void print(const string& line);
};
}  // namespace parley

#endif  // __PARLEY_CLIENT_SESSION__
