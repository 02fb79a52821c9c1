#include "test_support.hpp"

#include <huginn/index.hpp>
#include <huginn/sharder.hpp>

#include <filesystem>

using namespace huginn;
using namespace huginn_test;
namespace fs = std::filesystem;

TEST_CASE("unchanged shard is not rewritten") {
  auto root = mktemp_dir("huginn_flush_skip_");
  std::ostringstream out;
  IssueIndex idx({.issue_root = root, .logger = capture_logger(out)});

  REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.close("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.reopen("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.dirty_count() == 1);

  REQUIRE(idx.flush().ok());
  REQUIRE(idx.dirty_count() == 0);
  REQUIRE(out.str().find("write skipped") != std::string::npos);
}

TEST_CASE("flush keeps going past a failing shard") {
  auto root = mktemp_dir("huginn_flush_fail_");
  std::ostringstream out;
  IssueIndex idx({.issue_root = root, .logger = capture_logger(out)});

  REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.create("src/b.x", "20260110_111402").ok());

  // каталог на месте файла шарда: rename поверх него упадёт
  const auto bad = shard_path(root, compute_hash("src/a.x", 16));
  const auto good = shard_path(root, compute_hash("src/b.x", 16));
  fs::remove(bad);
  fs::create_directories(bad);

  REQUIRE(idx.close("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.close("src/b.x", "20260110_111402").ok());

  auto st = idx.flush();
  REQUIRE(st.code == Errc::IoFailure);
  REQUIRE(out.str().find("index flush failed") != std::string::npos);

  REQUIRE(slurp(good) == "[src/b.x]\n20260110_111402 = closed\n");
  REQUIRE(idx.dirty_count() == 1); // src/a.x ждёт следующего flush

  fs::remove_all(bad);
  REQUIRE(idx.flush().ok());
  REQUIRE(slurp(bad) == "[src/a.x]\n20260110_111401 = closed\n");
  REQUIRE(idx.dirty_count() == 0);
}

TEST_CASE("full scan discards unflushed changes") {
  auto root = mktemp_dir("huginn_flush_scan_");
  std::ostringstream out;
  IssueIndex idx({.issue_root = root, .flush_on_close = false, .logger = capture_logger(out)});

  REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.close("src/a.x", "20260110_111401").ok());

  auto scan = idx.full_scan();
  REQUIRE(scan.status.ok());
  REQUIRE(scan.count == 1);
  REQUIRE(out.str().find("full scan discards 1 unflushed") != std::string::npos);
  REQUIRE(idx.get("src/a.x").entry->status_of("20260110_111401") == RecordStatus::Open);
}

TEST_CASE("removing the last record deletes the shard on flush") {
  auto root = mktemp_dir("huginn_flush_rm_");
  IssueIndex idx({.issue_root = root});

  REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.create("src/a.x", "20260110_111402").ok());
  const auto shard = shard_path(root, compute_hash("src/a.x", 16));

  REQUIRE(idx.remove("src/a.x", "20260110_111401").ok());
  REQUIRE(idx.flush().ok());
  REQUIRE(slurp(shard) == "[src/a.x]\n20260110_111402 = open\n");

  REQUIRE(idx.remove("src/a.x", "20260110_111402").ok());
  REQUIRE(idx.flush().ok());
  REQUIRE_FALSE(fs::exists(shard));
  REQUIRE(idx.dirty_count() == 0);
  REQUIRE_FALSE(idx.get("src/a.x").entry.has_value());
}

TEST_CASE("destructor logs a failed final flush instead of throwing") {
  auto root = mktemp_dir("huginn_flush_dtor_");
  std::ostringstream out;
  const auto shard = shard_path(root, compute_hash("src/a.x", 16));
  {
    IssueIndex idx({.issue_root = root, .logger = capture_logger(out)});
    REQUIRE(idx.create("src/a.x", "20260110_111401").ok());
    REQUIRE(idx.close("src/a.x", "20260110_111401").ok());
    fs::remove(shard);
    fs::create_directories(shard);
  }
  REQUIRE(out.str().find("final index flush failed") != std::string::npos);
  REQUIRE(fs::is_directory(shard));
}
