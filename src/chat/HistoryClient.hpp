#ifndef __PARLEY_HISTORY_CLIENT__
#define __PARLEY_HISTORY_CLIENT__

#include "Headers.hpp"
#include "Identity.hpp"
#include "Message.hpp"

namespace parley {
/**
 * @brief Loads the stored messages of a conversation over the REST API so
 * the state store can be seeded before live frames arrive.
 */
class HistoryClient {
 public:
  explicit HistoryClient(const string& _apiBaseUrl);

  /**
   * @brief Blocking `GET /api/v1/conversations/{id}` with the credential as
   * bearer token.
   * @return the messages in server order, or nullopt after logging the
   * failure.
   */
  optional<vector<Message>> fetch(const Identity& identity);

  /**
   * @brief Extracts the `messages` array of a conversation document.
   * @throws MalformedFrameError when the body does not have that shape.
   */
  static vector<Message> parseHistory(const string& body);

  /**
   * @brief Splits the API root into `scheme://host[:port]` and a path
   * prefix without trailing '/'.
   */
  static void splitBaseUrl(const string& apiBaseUrl, string* schemeHostPort,
                           string* pathPrefix);

 protected:
  string apiBaseUrl;
};
}  // namespace parley

#endif  // __PARLEY_HISTORY_CLIENT__
