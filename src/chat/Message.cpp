#include "Message.hpp"

#include "ChatError.hpp"

namespace parley {
namespace {
// Returns the first key present in the object, or nullptr.
const json* findEither(const json& j, const char* serverKey,
                       const char* modelKey) {
  auto it = j.find(serverKey);
  if (it != j.end()) {
    return &(*it);
  }
  it = j.find(modelKey);
  if (it != j.end()) {
    return &(*it);
  }
  return nullptr;
}

const json& requireField(const json& j, const char* serverKey,
                         const char* modelKey) {
  auto field = findEither(j, serverKey, modelKey);
  if (field == nullptr || field->is_null()) {
    throw MalformedFrameError(string("Message is missing ") + serverKey);
  }
  return *field;
}

bool optionalFlag(const json& j, const char* serverKey, const char* modelKey) {
  auto field = findEither(j, serverKey, modelKey);
  if (field == nullptr || field->is_null()) {
    return false;
  }
  if (!field->is_boolean()) {
    throw MalformedFrameError(string("Message field ") + serverKey +
                              " is not a boolean");
  }
  return field->get<bool>();
}
}  // namespace

bool parseSenderRole(const string& name, SenderRole* role) {
  if (name == "user" || name == "client") {
    *role = SenderRole::CLIENT;
    return true;
  }
  if (name == "lawyer" || name == "counterpart") {
    *role = SenderRole::COUNTERPART;
    return true;
  }
  return false;
}

string senderRoleName(SenderRole role) {
  switch (role) {
    case SenderRole::CLIENT:
      return "client";
    case SenderRole::COUNTERPART:
      return "counterpart";
  }
  return "unknown";
}

Message messageFromJson(const json& j) {
  if (!j.is_object()) {
    throw MalformedFrameError("Message is not an object");
  }
  Message message;

  const json& id = requireField(j, "message_id", "id");
  if (!id.is_string() || id.get<string>().empty()) {
    throw MalformedFrameError("Message id is not a non-empty string");
  }
  message.id = id.get<string>();

  const json& senderId = requireField(j, "sender_id", "senderId");
  if (!senderId.is_number_integer()) {
    throw MalformedFrameError("Message sender id is not an integer");
  }
  message.senderId = senderId.get<int64_t>();

  const json& senderRole = requireField(j, "sender_type", "senderRole");
  if (!senderRole.is_string() ||
      !parseSenderRole(senderRole.get<string>(), &message.senderRole)) {
    throw MalformedFrameError("Message has an unknown sender role: " +
                              senderRole.dump());
  }

  const json& text = requireField(j, "text", "text");
  if (!text.is_string()) {
    throw MalformedFrameError("Message text is not a string");
  }
  message.text = text.get<string>();

  auto timestamp = findEither(j, "timestamp", "timestamp");
  if (timestamp != nullptr && timestamp->is_string()) {
    message.timestamp = timestamp->get<string>();
  }

  message.readByClient = optionalFlag(j, "read_by_user", "readByClient");
  message.readByCounterpart =
      optionalFlag(j, "read_by_lawyer", "readByCounterpart");
  return message;
}

json messageToJson(const Message& message) {
  json j;
  j["message_id"] = message.id;
  j["sender_id"] = message.senderId;
  j["sender_type"] =
      message.senderRole == SenderRole::CLIENT ? "user" : "lawyer";
  j["text"] = message.text;
  j["timestamp"] = message.timestamp;
  j["read_by_user"] = message.readByClient;
  j["read_by_lawyer"] = message.readByCounterpart;
  return j;
}
}  // namespace parley
