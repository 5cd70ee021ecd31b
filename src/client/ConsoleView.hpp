#ifndef __PARLEY_CONSOLE_VIEW__
#define __PARLEY_CONSOLE_VIEW__

#include "ConversationStateStore.hpp"
#include "Headers.hpp"

namespace parley {
/**
 * @brief Renders conversation state changes as lines of text.
 *
 * Lines go to the `stdout` logger by default; subclasses can capture them.
 */
class ConsoleView {
 public:
  explicit ConsoleView(shared_ptr<ConversationStateStore> _store);

  virtual ~ConsoleView();

  /** @brief One-line rendering of a message from the local user's view. */
  static string formatMessage(const Message& message);

 protected:
  shared_ptr<ConversationStateStore> store;
  SubscriptionId subscription;
  /** @brief How many log entries have been printed so far. */
  size_t renderedCount;
  string lastRenderedId;
  /** @brief Own messages the counterpart has read, last time we looked. */
  int readByCounterpart;

  void onChange(StoreChange change);

  void renderMessages();

  void renderReadReceipts();

  virtual void print(const string& line);
};
}  // namespace parley

#endif  // __PARLEY_CONSOLE_VIEW__
