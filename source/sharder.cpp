#include <huginn/sharder.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace huginn {

int clamp_hash_length(int n) {
  return std::clamp(n, kMinHashLength, kMaxHashLength);
}

std::optional<int> parse_hash_length(std::string_view s) {
  if (s.empty()) return std::nullopt;
  std::string buf(s);
  char* end = nullptr;
  errno = 0;
  long n = std::strtol(buf.c_str(), &end, 10);
  if (errno == ERANGE || end != buf.c_str() + buf.size()) return std::nullopt;
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
    return std::nullopt;
  return static_cast<int>(n);
}

static std::string sha256_hex(std::string_view data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;

  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

  if (1 != EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) ||
      1 != EVP_DigestUpdate(ctx, data.data(), data.size()) ||
      1 != EVP_DigestFinal_ex(ctx, md, &md_len)) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("sha256: digest failed");
  }
  EVP_MD_CTX_free(ctx);

  static const char hex[] = "0123456789abcdef";
  std::string out;
  out.resize(md_len * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    out[2 * i]     = hex[md[i] >> 4];
    out[2 * i + 1] = hex[md[i] & 0x0f];
  }
  return out;
}

std::string compute_hash(std::string_view key, int hash_length) {
  auto full = sha256_hex(key);
  full.resize(static_cast<std::size_t>(clamp_hash_length(hash_length)));
  return full;
}

std::filesystem::path index_dir(const std::filesystem::path& issue_root) {
  return issue_root / kIndexDirName;
}

std::filesystem::path shard_path(const std::filesystem::path& issue_root,
                                 const std::string& shard_hash) {
  return index_dir(issue_root) / shard_hash.substr(0, kFanoutPrefix) / shard_hash;
}

bool is_shard_name(std::string_view name) {
  if (name.size() < static_cast<std::size_t>(kMinHashLength) ||
      name.size() > static_cast<std::size_t>(kMaxHashLength))
    return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

} // namespace huginn
