#include "ClientConfig.hpp"

namespace parley {
namespace {
int64_t parseNumber(const char* value, const string& key) {
  try {
    size_t consumed = 0;
    string s(value);
    int64_t number = stoll(s, &consumed);
    if (consumed != s.size()) {
      throw std::invalid_argument(s);
    }
    return number;
  } catch (const std::logic_error& le) {
    throw std::runtime_error("Invalid value for " + key + ": " + value);
  }
}

bool parseFlag(const char* value, const string& key) {
  return parseNumber(value, key) != 0;
}
}  // namespace

ReconnectPolicy ClientConfig::makeReconnectPolicy() const {
  return ReconnectPolicy(std::chrono::milliseconds(baseDelayMs),
                         std::chrono::milliseconds(capDelayMs), maxAttempts);
}

void addClientOptions(cxxopts::Options* options,
                      const string& defaultLogDir) {
  options->add_options()            //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("u,api-url", "Base URL of the REST API",
       cxxopts::value<std::string>()->default_value(DEFAULT_API_URL))  //
      ("c,conversation", "Conversation id to join",
       cxxopts::value<std::string>())  //
      ("t,token", "Bearer token used to authenticate",
       cxxopts::value<std::string>())  //
      ("token-file", "File containing the bearer token",
       cxxopts::value<std::string>())  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"))  //
      ("l,logdir", "Base directory for log files.",
       cxxopts::value<std::string>()->default_value(defaultLogDir))  //
      ("logtostdout", "Write log to stdout")                          //
      ("silent", "Disable logging")                                   //
      ("no-history", "Do not load earlier messages on join");
}

ClientConfig buildClientConfig(const cxxopts::ParseResult& result) {
  ClientConfig config;
  if (result.count("cfgfile") &&
      !result["cfgfile"].as<std::string>().empty()) {
    applyConfigFile(result["cfgfile"].as<std::string>(), &config);
  }

  // Command line values win over the config file
  if (result.count("api-url") || config.apiUrl.empty()) {
    config.apiUrl = result["api-url"].as<std::string>();
  }
  if (result.count("conversation")) {
    config.conversationId = result["conversation"].as<std::string>();
  }
  if (result.count("token-file")) {
    config.tokenFile = result["token-file"].as<std::string>();
  }
  if (result.count("token")) {
    config.token = result["token"].as<std::string>();
  } else if (!config.tokenFile.empty()) {
    config.token = readTokenFile(config.tokenFile);
  }
  if (result.count("verbose")) {
    config.verbose = result["verbose"].as<int>();
  }
  config.logDir = result["logdir"].as<std::string>();
  if (result.count("logtostdout")) {
    config.logToStdout = true;
  }
  if (result.count("silent")) {
    config.silent = true;
  }
  if (result.count("no-history")) {
    config.fetchHistory = false;
  }

  validateClientConfig(config);
  return config;
}

void applyIni(const CSimpleIniA& ini, ClientConfig* config) {
  const char* apiUrl = ini.GetValue("Server", "api_url", NULL);
  if (apiUrl) {
    config->apiUrl = string(apiUrl);
  }

  const char* conversation = ini.GetValue("Session", "conversation", NULL);
  if (conversation) {
    config->conversationId = string(conversation);
  }
  const char* tokenFile = ini.GetValue("Session", "token_file", NULL);
  if (tokenFile) {
    config->tokenFile = string(tokenFile);
  }

  const char* baseDelay = ini.GetValue("Reconnect", "base_delay_ms", NULL);
  if (baseDelay) {
    config->baseDelayMs = parseNumber(baseDelay, "[Reconnect] base_delay_ms");
  }
  const char* capDelay = ini.GetValue("Reconnect", "cap_delay_ms", NULL);
  if (capDelay) {
    config->capDelayMs = parseNumber(capDelay, "[Reconnect] cap_delay_ms");
  }
  const char* maxAttempts = ini.GetValue("Reconnect", "max_attempts", NULL);
  if (maxAttempts) {
    config->maxAttempts =
        int(parseNumber(maxAttempts, "[Reconnect] max_attempts"));
  }

  const char* debounce = ini.GetValue("Typing", "debounce_ms", NULL);
  if (debounce) {
    config->typingDebounceMs = parseNumber(debounce, "[Typing] debounce_ms");
  }
  const char* idleStop = ini.GetValue("Typing", "idle_stop_ms", NULL);
  if (idleStop) {
    config->typingIdleStopMs = parseNumber(idleStop, "[Typing] idle_stop_ms");
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    config->verbose = int(parseNumber(vlevel, "[Debug] verbose"));
  }
  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = parseFlag(silent, "[Debug] silent");
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    // make sure maxlogsize is a string of int value
    config->maxLogSize = to_string(parseNumber(logsize, "[Debug] logsize"));
  }
}

void applyConfigFile(const string& path, ClientConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }
  applyIni(ini, config);
}

string readTokenFile(const string& path) {
  std::ifstream in(path);
  if (!in.good()) {
    throw std::runtime_error("Could not read token file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  string token = trim(buffer.str());
  if (token.empty()) {
    throw std::runtime_error("Token file is empty: " + path);
  }
  return token;
}

void validateClientConfig(const ClientConfig& config) {
  if (config.apiUrl.rfind("http://", 0) != 0 &&
      config.apiUrl.rfind("https://", 0) != 0) {
    throw std::runtime_error("API url must start with http:// or https://: " +
                             config.apiUrl);
  }
  if (config.baseDelayMs <= 0) {
    throw std::runtime_error("Reconnect base delay must be positive");
  }
  if (config.capDelayMs < config.baseDelayMs) {
    throw std::runtime_error(
        "Reconnect cap delay must not be below the base delay");
  }
  if (config.maxAttempts <= 0) {
    throw std::runtime_error("Reconnect max attempts must be at least 1");
  }
  if (config.typingDebounceMs < 0 || config.typingIdleStopMs < 0) {
    throw std::runtime_error("Typing delays must not be negative");
  }
  if (config.verbose < 0 || config.verbose > 9) {
    throw std::runtime_error("Verbose level must be between 0 and 9");
  }
}
}  // namespace parley
