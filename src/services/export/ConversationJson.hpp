#pragma once
#include <string>
#include <string_view>

#include "core/model/Conversation.hpp"

namespace llmd {
  // Plain JSON view of a conversation for tooling. Inline payloads are
  // base64 text under "data"; external ones are a "reference" string.
  ordered_json conversation_to_json(const Conversation& conversation);

  // Inverse of conversation_to_json. Metadata goes through the same rules as the
  // metadata section (MetadataError on bad input); messages and attachments
  // throw std::runtime_error naming the missing or mistyped field.
  Conversation conversation_from_json(const ordered_json& j);

  std::string base64_encode(std::string_view bytes);
  std::string base64_decode(std::string_view text);
}
