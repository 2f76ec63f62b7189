#include "Errors.hpp"

#include <utility>

namespace llmd {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Header:     return "HeaderError";
    case ErrorKind::Metadata:   return "MetadataError";
    case ErrorKind::Store:      return "StoreError";
    case ErrorKind::Validation: return "ValidationError";
    case ErrorKind::Io:         return "IoError";
  }
  return "Error";
}

const char* to_string(ParseStep step) {
  switch (step) {
    case ParseStep::Start:          return "Start";
    case ParseStep::HeaderRead:     return "HeaderRead";
    case ParseStep::MetadataRead:   return "MetadataRead";
    case ParseStep::StructuredRead: return "StructuredRead";
    case ParseStep::Validated:      return "Validated";
    case ParseStep::Done:           return "Done";
    case ParseStep::Failed:         return "Failed";
  }
  return "Unknown";
}

const char* to_string(HeaderErrc code) {
  switch (code) {
    case HeaderErrc::Truncated:          return "Truncated";
    case HeaderErrc::BadMagic:           return "BadMagic";
    case HeaderErrc::UnsupportedVersion: return "UnsupportedVersion";
    case HeaderErrc::BadOffsets:         return "BadOffsets";
    case HeaderErrc::Malformed:          return "Malformed";
    case HeaderErrc::ChecksumMismatch:   return "ChecksumMismatch";
  }
  return "Unknown";
}

const char* to_string(MetadataErrc code) {
  switch (code) {
    case MetadataErrc::SyntaxError:          return "SyntaxError";
    case MetadataErrc::MissingRequiredField: return "MissingRequiredField";
    case MetadataErrc::MalformedTimestamp:   return "MalformedTimestamp";
    case MetadataErrc::DuplicateParticipant: return "DuplicateParticipant";
    case MetadataErrc::WrongType:            return "WrongType";
  }
  return "Unknown";
}

const char* to_string(StoreErrc code) {
  switch (code) {
    case StoreErrc::SchemaMismatch:   return "SchemaMismatch";
    case StoreErrc::OrphanAttachment: return "OrphanAttachment";
    case StoreErrc::Corrupt:          return "Corrupt";
    case StoreErrc::Io:               return "Io";
  }
  return "Unknown";
}

const char* to_string(ValidationErrc code) {
  switch (code) {
    case ValidationErrc::SizeMismatch:          return "SizeMismatch";
    case ValidationErrc::VersionSkew:           return "VersionSkew";
    case ValidationErrc::MissingParticipants:   return "MissingParticipants";
    case ValidationErrc::DuplicateMessageId:    return "DuplicateMessageId";
    case ValidationErrc::OutOfOrderTimestamp:   return "OutOfOrderTimestamp";
    case ValidationErrc::DanglingAttachment:    return "DanglingAttachment";
    case ValidationErrc::DuplicateAttachmentId: return "DuplicateAttachmentId";
    case ValidationErrc::AttachmentIntegrity:   return "AttachmentIntegrity";
    case ValidationErrc::UnknownRole:           return "UnknownRole";
  }
  return "Unknown";
}

Error::Error(ErrorKind kind, std::string context, const std::string& message)
  : std::runtime_error(message),
    kind_(kind),
    context_(std::move(context)),
    detail_(message) {
  rebuild();
}

void Error::setStep(ParseStep step) {
  if (step_) return;
  step_ = step;
  rebuild();
}

// "<Kind> [step] (context): detail"
void Error::rebuild() {
  what_ = to_string(kind_);
  if (step_) {
    what_ += " [";
    what_ += to_string(*step_);
    what_ += "]";
  }
  if (!context_.empty()) {
    what_ += " (" + context_ + ")";
  }
  what_ += ": " + detail_;
}

HeaderError::HeaderError(HeaderErrc code, const std::string& message, std::string context)
  : Error(ErrorKind::Header, std::move(context),
          std::string(to_string(code)) + ": " + message),
    code_(code) {}

MetadataError::MetadataError(MetadataErrc code, std::string key, const std::string& message)
  : Error(ErrorKind::Metadata, std::move(key),
          std::string(to_string(code)) + ": " + message),
    code_(code) {}

StoreError::StoreError(StoreErrc code, std::string row, const std::string& message)
  : Error(ErrorKind::Store, std::move(row),
          std::string(to_string(code)) + ": " + message),
    code_(code) {}

ValidationError::ValidationError(ValidationErrc code, std::string entity, const std::string& message)
  : Error(ErrorKind::Validation, std::move(entity),
          std::string(to_string(code)) + ": " + message),
    code_(code) {}

} // namespace llmd
