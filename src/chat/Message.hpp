#ifndef __PARLEY_MESSAGE__
#define __PARLEY_MESSAGE__

#include "Headers.hpp"

namespace parley {
/**
 * @brief Which party of the conversation authored a message.
 */
enum class SenderRole {
  /** @brief The end user asking for advice (`user` on the wire). */
  CLIENT = 0,
  /** @brief The legal professional (`lawyer` on the wire). */
  COUNTERPART = 1
};

/**
 * @brief Maps wire role names onto SenderRole.
 *
 * Accepts both the server's names (`user`, `lawyer`) and the model's names
 * (`client`, `counterpart`).
 * @return false for any other value.
 */
bool parseSenderRole(const string& name, SenderRole* role);

string senderRoleName(SenderRole role);

/**
 * @brief One chat message. Two records with the same `id` are the same
 * logical message.
 */
struct Message {
  string id;
  int64_t senderId = 0;
  SenderRole senderRole = SenderRole::CLIENT;
  string text;
  /** @brief ISO-8601 string, kept exactly as the server sent it. */
  string timestamp;
  bool readByClient = false;
  bool readByCounterpart = false;
};

/**
 * @brief Decodes a message object in either the server or the model field
 * naming.
 * @throws MalformedFrameError when a required field is missing or mistyped.
 */
Message messageFromJson(const json& j);

/** @brief Encodes a message using the server's field names. */
json messageToJson(const Message& message);
}  // namespace parley

#endif  // __PARLEY_MESSAGE__
