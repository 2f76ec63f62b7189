#include "AtomicFile.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <unistd.h>

#include "core/Errors.hpp"
#include "core/model/Conversation.hpp"

namespace llmd {
namespace {

std::string errnoText(int err) { return std::strerror(err); }

// Owns a descriptor so every early throw closes it.
class Fd {
public:
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { if (fd_ >= 0) ::close(fd_); }

  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  int get() const { return fd_; }

  // Returns errno from close(), or 0.
  int release() {
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0 ? 0 : errno;
  }

private:
  int fd_;
};

void writeAll(int fd, std::string_view bytes, const std::string& name) {
  size_t done = 0;
  while (done < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + done, bytes.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw IoError(name, "write failed: " + errnoText(errno));
    }
    done += static_cast<size_t>(n);
  }
}

// Makes the rename itself durable.
void syncDirectory(const std::filesystem::path& dir) {
  const std::string name = dir.empty() ? std::string(".") : dir.string();
  Fd fd(::open(name.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (fd.get() < 0) throw IoError(name, "cannot open directory: " + errnoText(errno));
  if (::fsync(fd.get()) != 0) throw IoError(name, "directory flush failed: " + errnoText(errno));
}

} // namespace

void writeFileAtomic(const std::filesystem::path& target, std::string_view bytes) {
  namespace fs = std::filesystem;
  fs::path dir = target.parent_path();
  if (!dir.empty()) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw IoError(dir.string(), "cannot create directory: " + ec.message());
  }

  fs::path tmp = target;
  tmp += ".tmp-" + Conversation::newId();

  auto discard = [&tmp]() {
    std::error_code ec;
    fs::remove(tmp, ec);
    if (ec) spdlog::warn("could not remove temporary file {}: {}", tmp.string(), ec.message());
  };

  {
    Fd fd(::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644));
    if (fd.get() < 0) {
      throw IoError(tmp.string(), "cannot open temporary file for writing: " + errnoText(errno));
    }
    try {
      writeAll(fd.get(), bytes, tmp.string());
      if (::fsync(fd.get()) != 0) throw IoError(tmp.string(), "flush failed: " + errnoText(errno));
    } catch (const IoError&) {
      fd.release();
      discard();
      throw;
    }
    if (const int err = fd.release()) {
      discard();
      throw IoError(tmp.string(), "close failed: " + errnoText(err));
    }
  }

  if (::rename(tmp.c_str(), target.c_str()) != 0) {
    const int err = errno;
    discard();
    throw IoError(target.string(), "cannot replace target: " + errnoText(err));
  }
  syncDirectory(dir);
  spdlog::debug("wrote {} bytes to {}", bytes.size(), target.string());
}

} // namespace llmd
