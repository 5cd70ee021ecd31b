#ifndef __PARLEY_HEADERS__
#define __PARLEY_HEADERS__

#define CPPHTTPLIB_ZLIB_SUPPORT (1)
#define CPPHTTPLIB_OPENSSL_SUPPORT (1)
// httplib pulls in its own socket headers first
#include "httplib.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>
#include <paths.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "easylogging++.h"
#include "nlohmann/json.hpp"

using namespace std;

/**
 * @brief Exposes `nlohmann::json` as `json` everywhere in parley.
 */
using json = nlohmann::json;

#define STFATAL LOG(FATAL)

#define STERROR LOG(ERROR)

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef PARLEY_VERSION
#define PARLEY_VERSION "unknown"
#endif

namespace parley {
// Default REST API root when nothing is configured
const string DEFAULT_API_URL = "http://localhost:8000";

// WebSocket route for one conversation, relative to the API root
const string CONVERSATION_WS_PATH = "/api/v1/ws/conversation/";

// REST route that returns a conversation together with its messages
const string CONVERSATION_REST_PATH = "/api/v1/conversations/";

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline bool replace(std::string &str, const std::string &from,
                    const std::string &to) {
  auto start_pos = str.find(from);
  if (start_pos == std::string::npos) return false;
  str.replace(start_pos, from.length(), to);
  return true;
}

/**
 * @brief Strips leading and trailing whitespace (space, tab, CR, LF).
 */
inline string trim(const string &s) {
  static const char *whitespace = " \t\r\n\f\v";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace parley

#endif  // __PARLEY_HEADERS__
