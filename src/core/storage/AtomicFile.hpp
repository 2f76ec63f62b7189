#pragma once
#include <filesystem>
#include <string_view>

namespace llmd {

// Writes `bytes` to a temporary file beside `target`, fsyncs it, renames it
// over `target` and fsyncs the directory. On failure the temporary is
// removed and `target` is untouched. Throws IoError. POSIX only.
void writeFileAtomic(const std::filesystem::path& target, std::string_view bytes);

} // namespace llmd
