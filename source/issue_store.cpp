#include <huginn/issue_store.hpp>

#include <fmt/format.h>

#include <cctype>

namespace fs = std::filesystem;

namespace huginn {

static int digits(std::string_view s, size_t pos, size_t n) {
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) v = v * 10 + (s[i] - '0');
  return v;
}

std::optional<IssueId> parse_issue_id(std::string_view id) {
  if (id.size() != 15 || id[8] != '_') return std::nullopt;
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 8) continue;
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) return std::nullopt;
  }
  IssueId out;
  out.year   = digits(id, 0, 4);
  out.month  = digits(id, 4, 2);
  out.day    = digits(id, 6, 2);
  out.hour   = digits(id, 9, 2);
  out.minute = digits(id, 11, 2);
  out.second = digits(id, 13, 2);
  return out;
}

std::optional<fs::path> issue_path(const fs::path& issue_root, const std::string& id) {
  auto parsed = parse_issue_id(id);
  if (!parsed) return std::nullopt;
  return issue_root / fmt::format("{:04d}", parsed->year) /
         fmt::format("{:02d}", parsed->month) / id / "Issue.md";
}

bool issue_exists(const fs::path& issue_root, const std::string& id) {
  auto p = issue_path(issue_root, id);
  if (!p) return false;
  std::error_code ec;
  return fs::is_regular_file(*p, ec);
}

} // namespace huginn
