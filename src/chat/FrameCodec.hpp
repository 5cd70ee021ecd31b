#ifndef __PARLEY_FRAME_CODEC__
#define __PARLEY_FRAME_CODEC__

#include "ChatError.hpp"
#include "Headers.hpp"
#include "Message.hpp"

namespace parley {
enum class InboundFrameType {
  CONNECTION_ESTABLISHED = 0,
  NEW_MESSAGE = 1,
  TYPING_INDICATOR = 2,
  READ_RECEIPT = 3,
  SERVER_ERROR = 4,
  UNKNOWN = 5
};

/**
 * @brief One decoded server frame. Only the fields relevant to `type` are
 * populated.
 */
struct InboundFrame {
  InboundFrameType type = InboundFrameType::UNKNOWN;
  /** @brief The raw `type` string, kept for logging unknown frames. */
  string typeName;
  /** @brief NEW_MESSAGE payload. */
  Message message;
  /** @brief TYPING_INDICATOR payload. */
  bool isTyping = false;
  /** @brief Sender of a typing indicator or reader of a read receipt, when
   * the carried role is recognized. */
  optional<SenderRole> role;
  /** @brief The carried role string, kept for logging unrecognized roles. */
  string roleName;
  /** @brief READ_RECEIPT payload. */
  vector<string> messageIds;
  /** @brief ERROR payload. */
  string error;
};

/**
 * @brief Encodes and decodes the JSON frames of the conversation channel.
 */
class FrameCodec {
 public:
  static string encodeSendMessage(const string& text);

  static string encodeTyping(bool isTyping);

  static string encodeMarkRead();

  /**
   * @brief Parses one text frame.
   * @throws MalformedFrameError when the payload is not a JSON object, has
   * no string `type`, or a known type is missing its payload.
   */
  static InboundFrame decodeInbound(const string& text);
};
}  // namespace parley

#endif  // __PARLEY_FRAME_CODEC__
