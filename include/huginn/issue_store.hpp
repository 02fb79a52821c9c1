#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace huginn {

// ID issue: yyyyMMdd_HHmmss (UTC момент создания)
struct IssueId {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

std::optional<IssueId> parse_issue_id(std::string_view id);

// <issue_root>/<yyyy>/<MM>/<id>/Issue.md; nullopt для кривого id
std::optional<std::filesystem::path> issue_path(const std::filesystem::path& issue_root,
                                                const std::string& id);

// Оракул существования для check_integrity
bool issue_exists(const std::filesystem::path& issue_root, const std::string& id);

} // namespace huginn
