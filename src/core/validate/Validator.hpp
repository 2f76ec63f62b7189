#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/format/Header.hpp"
#include "core/model/Conversation.hpp"

namespace llmd {

// How a timestamp earlier than its predecessor is treated.
enum class TimestampPolicy {
  Strict,  // ValidationError::OutOfOrderTimestamp
  Warn     // logged, accepted (files from older producers)
};

// Accepts a role string. Empty means the closed set from isKnownRole().
using RolePredicate = std::function<bool(const std::string&)>;

struct ValidatorOptions {
  TimestampPolicy timestamps = TimestampPolicy::Strict;
  RolePredicate accept_role;
};

// What is known about the container when validating. Before a write there
// is no header yet.
struct ContainerInfo {
  uint8_t format_version = kFormatVersion;
  std::optional<Header> header;
  std::optional<uint64_t> file_size;
};

// True when `metadata_version` ("<major>.<minor>") belongs to the version
// family of container `format_version`.
bool isCompatibleVersion(uint8_t format_version, const std::string& metadata_version);

// Cross-checks header, metadata, messages and attachments. The first failed
// check throws ValidationError naming the offending entity.
class Validator {
public:
  explicit Validator(ValidatorOptions options = {});

  void validate(const ContainerInfo& container,
                const Metadata& metadata,
                const std::vector<Message>& messages,
                const std::vector<Attachment>& attachments) const;

  void validate(const ContainerInfo& container, const Conversation& conversation) const {
    validate(container, conversation.metadata(), conversation.messages(), conversation.attachments());
  }

private:
  void checkSize(const ContainerInfo& container) const;
  void checkVersion(const ContainerInfo& container, const Metadata& metadata) const;
  void checkParticipants(const Metadata& metadata, const std::vector<Message>& messages) const;
  void checkMessageIds(const std::vector<Message>& messages) const;
  void checkTimestamps(const std::vector<Message>& messages) const;
  void checkAttachments(const std::vector<Message>& messages,
                        const std::vector<Attachment>& attachments) const;
  void checkRoles(const std::vector<Message>& messages) const;

  ValidatorOptions options_;
};

} // namespace llmd
