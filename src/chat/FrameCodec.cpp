#include "FrameCodec.hpp"

namespace parley {
namespace {
void readRole(const json& j, InboundFrame* frame, const char* primary,
              const char* fallback) {
  auto it = j.find(primary);
  if (it == j.end() || !it->is_string()) {
    it = j.find(fallback);
  }
  if (it == j.end() || !it->is_string()) {
    return;
  }
  frame->roleName = it->get<string>();
  SenderRole role;
  if (parseSenderRole(frame->roleName, &role)) {
    frame->role = role;
  }
}
}  // namespace

string FrameCodec::encodeSendMessage(const string& text) {
  json j;
  j["type"] = "send_message";
  j["text"] = text;
  return j.dump();
}

string FrameCodec::encodeTyping(bool isTyping) {
  json j;
  j["type"] = "typing";
  j["is_typing"] = isTyping;
  return j.dump();
}

string FrameCodec::encodeMarkRead() {
  json j;
  j["type"] = "mark_read";
  return j.dump();
}

InboundFrame FrameCodec::decodeInbound(const string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& pe) {
    throw MalformedFrameError(string("Frame is not valid JSON: ") + pe.what());
  }
  if (!j.is_object()) {
    throw MalformedFrameError("Frame is not a JSON object");
  }
  auto typeIt = j.find("type");
  if (typeIt == j.end() || !typeIt->is_string()) {
    throw MalformedFrameError("Frame has no type");
  }

  InboundFrame frame;
  frame.typeName = typeIt->get<string>();
  if (frame.typeName == "connection_established") {
    frame.type = InboundFrameType::CONNECTION_ESTABLISHED;
  } else if (frame.typeName == "new_message") {
    frame.type = InboundFrameType::NEW_MESSAGE;
    auto messageIt = j.find("message");
    if (messageIt == j.end()) {
      throw MalformedFrameError("new_message frame has no message");
    }
    frame.message = messageFromJson(*messageIt);
  } else if (frame.typeName == "typing_indicator") {
    frame.type = InboundFrameType::TYPING_INDICATOR;
    auto typingIt = j.find("is_typing");
    if (typingIt != j.end() && !typingIt->is_null()) {
      if (!typingIt->is_boolean()) {
        throw MalformedFrameError("typing_indicator is_typing is not a bool");
      }
      frame.isTyping = typingIt->get<bool>();
    }
    readRole(j, &frame, "user_type", "sender_type");
  } else if (frame.typeName == "read_receipt") {
    frame.type = InboundFrameType::READ_RECEIPT;
    auto idsIt = j.find("message_ids");
    if (idsIt == j.end() || !idsIt->is_array()) {
      throw MalformedFrameError("read_receipt frame has no message_ids");
    }
    for (const auto& id : *idsIt) {
      if (!id.is_string()) {
        throw MalformedFrameError("read_receipt message id is not a string");
      }
      frame.messageIds.push_back(id.get<string>());
    }
    readRole(j, &frame, "user_type", "reader_type");
  } else if (frame.typeName == "error") {
    frame.type = InboundFrameType::SERVER_ERROR;
    auto errorIt = j.find("error");
    if (errorIt != j.end() && errorIt->is_string()) {
      frame.error = errorIt->get<string>();
    }
  } else {
    frame.type = InboundFrameType::UNKNOWN;
  }
  return frame;
}
}  // namespace parley
