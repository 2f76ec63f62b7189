#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace llmd {

enum class ErrorKind { Header, Metadata, Store, Validation, Io };

// Pipeline position at which a parse or write failed.
enum class ParseStep {
  Start,
  HeaderRead,
  MetadataRead,
  StructuredRead,
  Validated,
  Done,
  Failed
};

const char* to_string(ErrorKind kind);
const char* to_string(ParseStep step);

// Base of every error the library throws. `context` names the offending
// section, key or row so the caller can locate it.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, std::string context, const std::string& message);

  ErrorKind kind() const { return kind_; }
  const std::string& context() const { return context_; }
  const std::string& detail() const { return detail_; }
  std::optional<ParseStep> step() const { return step_; }

  // Tags the error with the pipeline step; the first tag wins.
  void setStep(ParseStep step);

  const char* what() const noexcept override { return what_.c_str(); }

private:
  void rebuild();

  ErrorKind kind_;
  std::string context_;
  std::string detail_;
  std::optional<ParseStep> step_;
  std::string what_;
};

enum class HeaderErrc {
  Truncated,
  BadMagic,
  UnsupportedVersion,
  BadOffsets,
  Malformed,
  ChecksumMismatch
};

enum class MetadataErrc {
  SyntaxError,
  MissingRequiredField,
  MalformedTimestamp,
  DuplicateParticipant,
  WrongType
};

enum class StoreErrc { SchemaMismatch, OrphanAttachment, Corrupt, Io };

enum class ValidationErrc {
  SizeMismatch,
  VersionSkew,
  MissingParticipants,
  DuplicateMessageId,
  OutOfOrderTimestamp,
  DanglingAttachment,
  DuplicateAttachmentId,
  AttachmentIntegrity,
  UnknownRole
};

const char* to_string(HeaderErrc code);
const char* to_string(MetadataErrc code);
const char* to_string(StoreErrc code);
const char* to_string(ValidationErrc code);

class HeaderError : public Error {
public:
  HeaderError(HeaderErrc code, const std::string& message, std::string context = "header");
  HeaderErrc code() const { return code_; }
private:
  HeaderErrc code_;
};

class MetadataError : public Error {
public:
  MetadataError(MetadataErrc code, std::string key, const std::string& message);
  MetadataErrc code() const { return code_; }
private:
  MetadataErrc code_;
};

class StoreError : public Error {
public:
  StoreError(StoreErrc code, std::string row, const std::string& message);
  StoreErrc code() const { return code_; }
private:
  StoreErrc code_;
};

class ValidationError : public Error {
public:
  ValidationError(ValidationErrc code, std::string entity, const std::string& message);
  ValidationErrc code() const { return code_; }
private:
  ValidationErrc code_;
};

class IoError : public Error {
public:
  IoError(std::string path, const std::string& message)
    : Error(ErrorKind::Io, std::move(path), message) {}
};

} // namespace llmd
