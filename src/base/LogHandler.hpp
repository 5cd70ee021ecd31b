#ifndef __PARLEY_LOG_HANDLER__
#define __PARLEY_LOG_HANDLER__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Configures easylogging++ for the parley library, client and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends log output to `path/filenamePrefix-<time>.log`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Deletes a log file that easylogging rolled over.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it only prints the message.
   *
   * The chat client renders conversation events through this logger.
   */
  static void setupStdoutLogger();

  /**
   * @brief Applies verbosity and the silent switch, then reconfigures the
   * default logger and installs the rollout callback.
   */
  static void applyConfiguration(el::Configurations *defaultConf, int verbose,
                                 bool silent);

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and exclusively creates the file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace parley
#endif  // __PARLEY_LOG_HANDLER__
