#include "test_support.hpp"

#include <huginn/index.hpp>
#include <huginn/integrity.hpp>
#include <huginn/issue_store.hpp>
#include <huginn/sharder.hpp>

#include <algorithm>
#include <filesystem>

using namespace huginn;
using namespace huginn_test;
namespace fs = std::filesystem;

static void make_issue(const fs::path& root, const std::string& id) {
  auto p = issue_path(root, id);
  REQUIRE(p.has_value());
  spit(*p, "# issue " + id + "\n");
}

TEST_CASE("issue ids and paths") {
  auto id = parse_issue_id("20260110_111401");
  REQUIRE(id.has_value());
  REQUIRE(id->year == 2026);
  REQUIRE(id->month == 1);
  REQUIRE(id->day == 10);
  REQUIRE(id->hour == 11);
  REQUIRE(id->minute == 14);
  REQUIRE(id->second == 1);

  REQUIRE_FALSE(parse_issue_id("20260110111401").has_value());
  REQUIRE_FALSE(parse_issue_id("2026011_0111401").has_value());
  REQUIRE_FALSE(parse_issue_id("20260110_11140x").has_value());
  REQUIRE_FALSE(parse_issue_id("").has_value());

  const fs::path root = "/proj/issues";
  REQUIRE(issue_path(root, "20260110_111401") ==
          root / "2026" / "01" / "20260110_111401" / "Issue.md");
  REQUIRE_FALSE(issue_path(root, "bogus").has_value());
}

TEST_CASE("issue_exists looks for Issue.md") {
  auto root = mktemp_dir("huginn_exists_");
  REQUIRE_FALSE(issue_exists(root, "20260110_111401"));
  make_issue(root, "20260110_111401");
  REQUIRE(issue_exists(root, "20260110_111401"));
  REQUIRE_FALSE(issue_exists(root, "bogus"));

  // каталог без Issue.md не считается
  fs::create_directories(root / "2026" / "02" / "20260201_000000");
  REQUIRE_FALSE(issue_exists(root, "20260201_000000"));
}

TEST_CASE("check evicts exactly the missing issues") {
  auto root = mktemp_dir("huginn_check_");
  {
    IssueIndex idx({.issue_root = root});
    REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
    REQUIRE(idx.create("src/a.x", "20260110_111402").ok());
    REQUIRE(idx.create("src/b.x", "20260110_111403").ok());
    REQUIRE(idx.create("src/c.x", "20260110_111404").ok());
  }
  make_issue(root, "20260110_111401");
  make_issue(root, "20260110_111404");

  auto rep = check_integrity(root, issue_exists);
  REQUIRE(rep.status.ok());
  REQUIRE(rep.checked == 4);
  REQUIRE(rep.evicted == 2);
  auto ids = rep.evicted_ids;
  std::sort(ids.begin(), ids.end());
  REQUIRE(ids == std::vector<std::string>{"20260110_111402", "20260110_111403"});

  // у src/b.x ничего не осталось: шард удалён
  REQUIRE_FALSE(fs::exists(shard_path(root, compute_hash("src/b.x", 16))));
  REQUIRE(slurp(shard_path(root, compute_hash("src/a.x", 16))) ==
          "[src/a.x]\n20260110_111401 = open\n");
  REQUIRE(slurp(shard_path(root, compute_hash("src/c.x", 16))) ==
          "[src/c.x]\n20260110_111404 = open\n");

  IssueIndex idx({.issue_root = root});
  REQUIRE(idx.full_scan().count == 2);
  REQUIRE_FALSE(idx.get("src/b.x").entry.has_value());

  // повторная проверка ничего не меняет
  auto again = check_integrity(root, issue_exists);
  REQUIRE(again.checked == 2);
  REQUIRE(again.evicted == 0);
}

TEST_CASE("check uses the given predicate") {
  auto root = mktemp_dir("huginn_check_pred_");
  {
    IssueIndex idx({.issue_root = root});
    REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
    REQUIRE(idx.create("src/a.x", "20260110_111402").ok());
  }
  size_t calls = 0;
  auto rep = check_integrity(root, [&](const fs::path& r, const std::string& id) {
    ++calls;
    REQUIRE(r == root);
    return id == "20260110_111402";
  });
  REQUIRE(calls == 2);
  REQUIRE(rep.evicted_ids == std::vector<std::string>{"20260110_111401"});
}

TEST_CASE("check on a missing tree reports nothing") {
  auto root = mktemp_dir("huginn_check_empty_");
  auto rep = check_integrity(root / "nope", issue_exists);
  REQUIRE(rep.status.ok());
  REQUIRE(rep.checked == 0);
  REQUIRE(rep.evicted == 0);
  REQUIRE(rep.evicted_ids.empty());
}
