#include <huginn/shard_store.hpp>
#include <huginn/shard_codec.hpp>
#include <huginn/sharder.hpp>
#include <huginn/util.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace huginn {

ShardRead read_shard(const fs::path& p) {
  ShardRead r;
  std::string err;
  auto content = read_file(p, &err);
  if (!content) {
    if (!err.empty()) r.status = Status::Error(Errc::IoFailure, err);
    return r;
  }
  r.found = true;
  r.fingerprint = content_fingerprint(*content);
  r.entries = parse_shard(*content);
  return r;
}

Status write_shard_content(const fs::path& p, std::string_view content) {
  std::string err;
  if (content.empty()) {
    if (!remove_file(p, &err)) return Status::Error(Errc::IoFailure, err);
    return Status::Ok();
  }
  if (!ensure_dir(p.parent_path(), &err)) return Status::Error(Errc::IoFailure, err);
  if (!write_file_atomic(p, content, &err)) return Status::Error(Errc::IoFailure, err);
  return Status::Ok();
}

Status write_shard(const fs::path& p, const ShardEntries& entries, uint64_t* fingerprint) {
  const auto content = serialize_shard(entries);
  auto st = write_shard_content(p, content);
  if (st.ok() && fingerprint) *fingerprint = content.empty() ? 0 : content_fingerprint(content);
  return st;
}

std::vector<fs::path> list_fanout_dirs(const fs::path& issue_root) {
  std::vector<fs::path> out;
  std::error_code ec;
  const auto idx = index_dir(issue_root);
  if (!fs::is_directory(idx, ec)) return out;

  for (fs::directory_iterator it(idx, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_directory(ec)) out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<ShardFile> list_shard_files(const fs::path& issue_root, Status* status) {
  std::vector<ShardFile> out;
  for (const auto& dir : list_fanout_dirs(issue_root)) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      if (!it->is_regular_file(ec)) continue;
      auto name = it->path().filename().string();
      // *.tmp от недописанной атомарной записи сюда не попадают
      if (!is_shard_name(name)) continue;
      out.push_back({it->path(), name});
    }
    if (ec && status && status->ok())
      *status = Status::Error(Errc::IoFailure, "scan failed: " + dir.string() + ": " + ec.message());
  }
  std::sort(out.begin(), out.end(),
            [](const auto& a, const auto& b) { return a.path < b.path; });
  return out;
}

size_t prune_empty_fanout_dirs(const fs::path& issue_root) {
  size_t removed = 0;
  for (const auto& dir : list_fanout_dirs(issue_root)) {
    std::error_code ec;
    if (fs::is_empty(dir, ec) && !ec && fs::remove(dir, ec)) ++removed;
  }
  return removed;
}

bool ensure_ignore_marker(const fs::path& issue_root, std::string* err) {
  const auto idx = index_dir(issue_root);
  const auto marker = idx / ".gitignore";
  std::error_code ec;
  if (fs::exists(marker, ec)) return true;
  if (!ensure_dir(idx, err)) return false;
  return write_file_atomic(marker, "*\n", err);
}

} // namespace huginn
