#include "Validator.hpp"

#include <cctype>
#include <set>
#include <spdlog/spdlog.h>
#include <utility>

#include "core/Errors.hpp"
#include "core/format/Digest.hpp"

namespace llmd {
namespace {

// "<major>.<minor>" with both parts numeric; nullopt otherwise.
std::optional<int> majorOf(const std::string& version) {
  const auto dot = version.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == version.size()) return std::nullopt;
  for (size_t i = 0; i < version.size(); ++i) {
    if (i == dot) continue;
    if (!std::isdigit(static_cast<unsigned char>(version[i]))) return std::nullopt;
  }
  if (dot > 4) return std::nullopt;
  return std::stoi(version.substr(0, dot));
}

} // namespace

bool isCompatibleVersion(uint8_t format_version, const std::string& metadata_version) {
  const auto major = majorOf(metadata_version);
  if (!major) return false;
  // Container v1 carries the 0.x drafts and 1.x.
  if (format_version == 1) return *major == 0 || *major == 1;
  return false;
}

Validator::Validator(ValidatorOptions options)
  : options_(std::move(options)) {}

void Validator::validate(const ContainerInfo& container,
                         const Metadata& metadata,
                         const std::vector<Message>& messages,
                         const std::vector<Attachment>& attachments) const {
  checkSize(container);
  checkVersion(container, metadata);
  checkParticipants(metadata, messages);
  checkMessageIds(messages);
  checkTimestamps(messages);
  checkAttachments(messages, attachments);
  checkRoles(messages);
}

void Validator::checkSize(const ContainerInfo& container) const {
  if (!container.header || !container.file_size) return;
  const auto implied = container.header->impliedFileSize();
  if (implied != *container.file_size) {
    throw ValidationError(ValidationErrc::SizeMismatch, "file",
                          "header implies " + std::to_string(implied) + " bytes, file has " +
                          std::to_string(*container.file_size));
  }
}

void Validator::checkVersion(const ContainerInfo& container, const Metadata& metadata) const {
  const uint8_t format = container.header ? container.header->version : container.format_version;
  if (!isCompatibleVersion(format, metadata.version)) {
    throw ValidationError(ValidationErrc::VersionSkew, "metadata.version",
                          "metadata version \"" + metadata.version +
                          "\" is not compatible with container version " + std::to_string(format));
  }
}

void Validator::checkParticipants(const Metadata& metadata, const std::vector<Message>& messages) const {
  if (!messages.empty() && metadata.participants.empty()) {
    throw ValidationError(ValidationErrc::MissingParticipants, "metadata.participants",
                          "conversation has messages but no participants");
  }
}

void Validator::checkMessageIds(const std::vector<Message>& messages) const {
  std::set<std::string> seen;
  for (const auto& m : messages) {
    if (!seen.insert(m.id).second) {
      throw ValidationError(ValidationErrc::DuplicateMessageId, m.id,
                            "message id \"" + m.id + "\" appears more than once");
    }
  }
}

void Validator::checkTimestamps(const std::vector<Message>& messages) const {
  for (size_t i = 1; i < messages.size(); ++i) {
    const auto& prev = messages[i - 1];
    const auto& cur = messages[i];
    if (cur.timestamp < prev.timestamp) {
      const std::string msg = "timestamp " + cur.timestamp.format() + " precedes " +
                              prev.timestamp.format() + " of \"" + prev.id + "\"";
      if (options_.timestamps == TimestampPolicy::Strict) {
        throw ValidationError(ValidationErrc::OutOfOrderTimestamp, cur.id, msg);
      }
      spdlog::warn("message {}: {} (accepted)", cur.id, msg);
    }
  }
}

void Validator::checkAttachments(const std::vector<Message>& messages,
                                 const std::vector<Attachment>& attachments) const {
  std::set<std::string> message_ids;
  for (const auto& m : messages) message_ids.insert(m.id);

  for (const auto& a : attachments) {
    if (!message_ids.count(a.message_id)) {
      throw ValidationError(ValidationErrc::DanglingAttachment, a.id,
                            "owning message \"" + a.message_id + "\" does not exist");
    }
  }

  std::set<std::string> seen;
  for (const auto& a : attachments) {
    if (!seen.insert(a.id).second) {
      throw ValidationError(ValidationErrc::DuplicateAttachmentId, a.id,
                            "attachment id appears more than once");
    }
  }

  for (const auto& a : attachments) {
    const auto* data = std::get_if<InlineData>(&a.payload);
    if (!data) continue;
    if (a.size && *a.size != data->bytes.size()) {
      throw ValidationError(ValidationErrc::AttachmentIntegrity, a.id,
                            "declared size " + std::to_string(*a.size) + ", payload has " +
                            std::to_string(data->bytes.size()) + " bytes");
    }
    // Only the sha256 form is verifiable; other checksums are opaque.
    if (a.checksum && a.checksum->rfind("sha256:", 0) == 0 &&
        *a.checksum != attachment_checksum(data->bytes)) {
      throw ValidationError(ValidationErrc::AttachmentIntegrity, a.id,
                            "payload does not match checksum " + *a.checksum);
    }
  }
}

void Validator::checkRoles(const std::vector<Message>& messages) const {
  for (const auto& m : messages) {
    const bool ok = options_.accept_role ? options_.accept_role(m.role) : isKnownRole(m.role);
    if (!ok) {
      throw ValidationError(ValidationErrc::UnknownRole, m.id,
                            "role \"" + m.role + "\" is not accepted");
    }
  }
}

} // namespace llmd
