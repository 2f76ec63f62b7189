#pragma once
#include <string>
#include <string_view>

#include "core/model/Conversation.hpp"

namespace llmd {

// Metadata section <-> JSON text. Recognised keys are emitted first in a
// fixed order, followed by extension keys in the order they were read.
std::string serializeMetadata(const Metadata& metadata);

// Throws MetadataError (SyntaxError, MissingRequiredField,
// MalformedTimestamp, DuplicateParticipant, WrongType).
Metadata deserializeMetadata(std::string_view text);

} // namespace llmd
