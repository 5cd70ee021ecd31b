#ifndef __PARLEY_CLIENT_CONFIG__
#define __PARLEY_CLIENT_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"
#include "ReconnectPolicy.hpp"
#include "SimpleIni.h"
#include "TypingSignalThrottle.hpp"

namespace parley {
/**
 * @brief Settings of the `parley` terminal client, merged from the command
 * line and the optional INI file.
 */
struct ClientConfig {
  string apiUrl = DEFAULT_API_URL;
  string conversationId;
  string token;
  string tokenFile;

  int verbose = 0;
  string logDir;
  bool logToStdout = false;
  bool silent = false;
  string maxLogSize = "20971520";

  int64_t baseDelayMs = ReconnectPolicy::DEFAULT_BASE_DELAY_MS;
  int64_t capDelayMs = ReconnectPolicy::DEFAULT_CAP_DELAY_MS;
  int maxAttempts = ReconnectPolicy::DEFAULT_MAX_ATTEMPTS;

  int64_t typingDebounceMs = TypingSignalThrottle::DEFAULT_DEBOUNCE_MS;
  int64_t typingIdleStopMs = 2000;

  bool fetchHistory = true;

  ReconnectPolicy makeReconnectPolicy() const;
};

/**
 * @brief Declares every command line flag of the client.
 */
void addClientOptions(cxxopts::Options* options, const string& defaultLogDir);

/**
 * @brief Builds the configuration from parsed flags. When `--cfgfile` is
 * present the file is applied first and explicit flags override it.
 * @throws std::runtime_error for an unreadable file or an invalid value.
 */
ClientConfig buildClientConfig(const cxxopts::ParseResult& result);

/**
 * @brief Applies an INI document to the configuration.
 * @throws std::runtime_error when a numeric value does not parse.
 */
void applyIni(const CSimpleIniA& ini, ClientConfig* config);

/**
 * @brief Loads and applies an INI file.
 * @throws std::runtime_error when the file cannot be read.
 */
void applyConfigFile(const string& path, ClientConfig* config);

/**
 * @brief Reads the credential from a file, trimming surrounding whitespace.
 * @throws std::runtime_error when the file cannot be read or is empty.
 */
string readTokenFile(const string& path);

/**
 * @brief Rejects values the client cannot run with.
 * @throws std::runtime_error describing the first invalid value.
 */
void validateClientConfig(const ClientConfig& config);
}  // namespace parley

#endif  // __PARLEY_CLIENT_CONFIG__
