#include <cxxopts.hpp>

#include "AsioEventLoop.hpp"
#include "ClientConfig.hpp"
#include "ClientSession.hpp"
#include "ConnectionManager.hpp"
#include "ConsoleView.hpp"
#include "ConversationStateStore.hpp"
#include "Headers.hpp"
#include "HistoryClient.hpp"
#include "LifecycleCoordinator.hpp"
#include "LogHandler.hpp"
#include "WebSocketTransport.hpp"

using namespace parley;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  parley::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, parley::InterruptSignalHandler);

  cxxopts::Options options("parley",
                           "Terminal client for legal consultation chats");
  ClientConfig config;
  try {
    addClientOptions(&options, tmpDir);
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "parley version " << PARLEY_VERSION << endl;
      exit(0);
    }

    config = buildClientConfig(result);
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const std::runtime_error& re) {
    CLOG(INFO, "stdout") << re.what() << endl;
    exit(1);
  }

  if (config.conversationId.empty() || config.token.empty()) {
    CLOG(INFO, "stdout")
        << "A conversation (-c) and a token (-t or --token-file) are required"
        << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  LogHandler::setupLogFiles(&defaultConf, config.logDir, "parley",
                            config.logToStdout, !config.logToStdout, true,
                            config.maxLogSize);
  LogHandler::applyConfiguration(&defaultConf, config.verbose, config.silent);

  AsioEventLoop loop;
  auto store = make_shared<ConversationStateStore>();
  auto transportFactory =
      make_shared<WebSocketTransportFactory>(loop.getIoContext());
  ConnectionManager manager(
      loop, transportFactory, store, config.apiUrl,
      config.makeReconnectPolicy(),
      std::chrono::milliseconds(config.typingDebounceMs),
      std::chrono::milliseconds(config.typingIdleStopMs));
  LifecycleCoordinator coordinator(manager, store);
  ConsoleView view(store);
  HistoryClient historyClient(config.apiUrl);

  ClientSession::HistoryLoader historyLoader;
  if (config.fetchHistory) {
    historyLoader = [&historyClient](const Identity& identity) {
      return historyClient.fetch(identity);
    };
  }
  ClientSession session(manager, coordinator, store, config.token,
                        historyLoader, [&loop]() {
                          // Give the close handshake a moment to go out
                          loop.runAfter(std::chrono::milliseconds(250),
                                        [&loop]() { loop.stop(); });
                        });

  loop.post([&session, &config]() {
    CLOG(INFO, "stdout") << "Joining conversation " << config.conversationId
                         << ", type /help for commands" << endl;
    session.join(config.conversationId);
  });

  // getline blocks, so input is read off the loop and handed over
  std::thread inputThread([&loop, &session]() {
    el::Helpers::setThreadName("Input");
    string line;
    while (std::getline(cin, line)) {
      loop.post([&session, line]() { session.handleLine(line); });
    }
    loop.post([&session]() { session.handleLine("/quit"); });
  });
  inputThread.detach();

  el::Helpers::setThreadName("Main");
  loop.run();

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  // The input thread may still be blocked on stdin and holds references to
  // the objects above, so skip their destructors.
  exit(0);
}
