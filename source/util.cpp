#include <huginn/util.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <xxhash.h>

namespace fs = std::filesystem;

namespace huginn {

std::string trim(std::string_view s) {
  size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e-1] == ' ' || s[e-1] == '\t' || s[e-1] == '\r' || s[e-1] == '\n')) --e;
  return std::string(s.substr(b, e - b));
}

bool ensure_dir(const fs::path& p, std::string* err) {
  std::error_code ec;
  if (fs::is_directory(p, ec)) return true;
  fs::create_directories(p, ec);
  if (ec) {
    if (err) *err = "mkdir failed: " + p.string() + ": " + ec.message();
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p, std::string* err) {
  std::error_code ec;
  if (!fs::exists(p, ec)) return std::nullopt;
  std::ifstream in(p, std::ios::binary);
  if (!in.is_open()) {
    if (err) *err = "open failed: " + p.string();
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    if (err) *err = "read failed: " + p.string();
    return std::nullopt;
  }
  return ss.str();
}

static inline void fsync_dir_path(const fs::path& dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

bool write_file_atomic(const fs::path& p, std::string_view content, std::string* err) {
  auto tmp = p;
  tmp += ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    if (err) *err = "open failed: " + tmp.string() + ": " + std::strerror(errno);
    return false;
  }

  const char* data = content.data();
  size_t left = content.size();
  while (left > 0) {
    ssize_t n = ::write(fd, data, left);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      if (err) *err = "write failed: " + tmp.string() + ": " + std::strerror(errno);
      ::close(fd);
      ::unlink(tmp.c_str());
      return false;
    }
    data += n;
    left -= static_cast<size_t>(n);
  }

  // содержимое на диск до переименования
  if (::fsync(fd) != 0) {
    if (err) *err = "fsync failed: " + tmp.string() + ": " + std::strerror(errno);
    ::close(fd);
    ::unlink(tmp.c_str());
    return false;
  }
  ::close(fd);

  if (::rename(tmp.c_str(), p.c_str()) != 0) {
    if (err) *err = "rename failed: " + p.string() + ": " + std::strerror(errno);
    ::unlink(tmp.c_str());
    return false;
  }

  fsync_dir_path(p.parent_path());
  return true;
}

bool remove_file(const fs::path& p, std::string* err) {
  if (::unlink(p.c_str()) == 0 || errno == ENOENT) return true;
  if (err) *err = "unlink failed: " + p.string() + ": " + std::strerror(errno);
  return false;
}

uint64_t content_fingerprint(std::string_view content) {
  return static_cast<uint64_t>(XXH64(content.data(), content.size(), 0));
}

} // namespace huginn
