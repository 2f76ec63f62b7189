#pragma once
#include <filesystem>
#include <string>

#include "core/model/Conversation.hpp"
#include "core/validate/Validator.hpp"

namespace llmd {

struct WriterOptions {
  // Store SHA-256 digests of both sections in the header.
  bool section_checksums = true;
  RolePredicate accept_role;
};

// Validates strictly, serialises metadata then the structured section, and
// synthesises the header last from their sizes. Holds no state between
// calls.
class Writer {
public:
  explicit Writer(WriterOptions options = {});

  std::string writeBytes(const Conversation& conversation) const;

  // Atomic replace of `path`; on any failure the target is left untouched.
  void writeFile(const Conversation& conversation, const std::filesystem::path& path) const;

private:
  WriterOptions options_;
};

} // namespace llmd
