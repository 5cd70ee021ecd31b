#include "HistoryClient.hpp"

#include "ChatError.hpp"
#include "WebSocketUrl.hpp"

namespace parley {
HistoryClient::HistoryClient(const string& _apiBaseUrl)
    : apiBaseUrl(_apiBaseUrl) {}

optional<vector<Message>> HistoryClient::fetch(const Identity& identity) {
  if (!identity.isComplete()) {
    LOG(INFO) << "Not fetching history, identity is incomplete: " << identity;
    return nullopt;
  }
  string schemeHostPort, pathPrefix;
  splitBaseUrl(apiBaseUrl, &schemeHostPort, &pathPrefix);
  string path = pathPrefix + CONVERSATION_REST_PATH +
                percentEncode(identity.conversationId);

  httplib::Client client(schemeHostPort);
  client.set_connection_timeout(5, 0);
  client.set_read_timeout(10, 0);
  httplib::Headers headers;
  headers.emplace("Authorization", "Bearer " + identity.credential);
  headers.emplace("Accept", "application/json");

  VLOG(1) << "Fetching history from " << schemeHostPort << path;
  auto res = client.Get(path.c_str(), headers);
  if (!res) {
    STERROR << "History request failed with httplib error "
            << static_cast<int>(res.error());
    return nullopt;
  }
  if (res->status != 200) {
    STERROR << "History request returned HTTP " << res->status;
    return nullopt;
  }
  try {
    auto messages = parseHistory(res->body);
    LOG(INFO) << "Loaded " << messages.size() << " messages of history";
    return messages;
  } catch (const MalformedFrameError& mfe) {
    STERROR << "Invalid history response: " << mfe.what();
  }
  return nullopt;
}

vector<Message> HistoryClient::parseHistory(const string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& pe) {
    throw MalformedFrameError(string("History is not valid JSON: ") +
                              pe.what());
  }
  if (!j.is_object()) {
    throw MalformedFrameError("History is not a JSON object");
  }
  vector<Message> messages;
  auto it = j.find("messages");
  if (it == j.end() || it->is_null()) {
    return messages;
  }
  if (!it->is_array()) {
    throw MalformedFrameError("History messages is not an array");
  }
  for (const auto& entry : *it) {
    messages.push_back(messageFromJson(entry));
  }
  return messages;
}

void HistoryClient::splitBaseUrl(const string& apiBaseUrl,
                                 string* schemeHostPort, string* pathPrefix) {
  string base = apiBaseUrl;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  auto schemeEnd = base.find("://");
  auto pathStart = base.find('/', schemeEnd == string::npos ? 0 : schemeEnd + 3);
  if (pathStart == string::npos) {
    *schemeHostPort = base;
    *pathPrefix = "";
  } else {
    *schemeHostPort = base.substr(0, pathStart);
    *pathPrefix = base.substr(pathStart);
  }
}
}  // namespace parley
