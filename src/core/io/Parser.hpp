#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "core/Errors.hpp"
#include "core/format/Header.hpp"
#include "core/model/Conversation.hpp"
#include "core/validate/Validator.hpp"

namespace llmd {

enum class ChecksumPolicy {
  Verify,  // mismatch is HeaderError::ChecksumMismatch
  Ignore
};

struct ParserOptions {
  TimestampPolicy timestamps = TimestampPolicy::Warn;
  ChecksumPolicy checksums = ChecksumPolicy::Verify;
  RolePredicate accept_role;
};

// Start -> HeaderRead -> MetadataRead -> StructuredRead -> Validated -> Done.
// Any failure moves to Failed and rethrows the component's error tagged
// with the step that was being attempted. Nothing is retried.
class Parser {
public:
  explicit Parser(ParserOptions options = {});

  Conversation parseFile(const std::filesystem::path& path);
  Conversation parseBytes(std::string_view bytes);

  ParseStep state() const { return state_; }
  // Header of the last parse that got past HeaderRead.
  const std::optional<Header>& header() const { return header_; }

private:
  // reader(offset, length) returns exactly `length` bytes or throws.
  using SectionReader = std::function<std::string(uint64_t offset, uint64_t length)>;

  Conversation run(uint64_t file_size, const SectionReader& reader);
  std::string readSection(const SectionReader& reader, const char* name,
                          const SectionRange& range,
                          const std::optional<Sha256Digest>& expected) const;

  ParserOptions options_;
  ParseStep state_ = ParseStep::Start;
  std::optional<Header> header_;
};

} // namespace llmd
