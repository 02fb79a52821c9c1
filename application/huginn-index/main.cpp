#include <huginn/config.hpp>
#include <huginn/index.hpp>
#include <huginn/integrity.hpp>
#include <huginn/issue_store.hpp>
#include <huginn/logging.hpp>
#include <huginn/sharder.hpp>
#include <huginn/util.hpp>

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace huginn;

// ----------------------------
// Разбор аргументов
// ----------------------------
struct Args {
  fs::path root = ".";           // откуда искать .huginn
  bool verbose = false;
  std::string command;
  std::vector<std::string> rest;
  bool help = false;
  bool bad = false;
};

static void print_usage(const char* prog) {
  fmt::print(
R"(Usage:
  {0} [--root DIR] [--verbose] <command> [args]

Commands:
  init                       : write a commented default .huginn into DIR
  get <file>                 : print indexed issues for <file>
  create <file> <id>         : register issue <id> for <file>
  close <file> <id>          : mark issue closed
  reopen <file> <id>         : mark issue open
  remove <file> <id>         : drop issue from <file>
  list                       : full scan, print every entry
  migrate <length>           : re-shard index to hash length 16..64
  check                      : evict issues whose Issue.md is gone

Examples:
  {0} create src/main.cpp 20260110_111401
  {0} --root ~/project migrate 32
)",
    prog);
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    std::string_view t = argv[i];
    if (t == "-h" || t == "--help") { a.help = true; break; }
    if (t == "--verbose" || t == "-v") { a.verbose = true; continue; }
    if (t == "--root") {
      if (i + 1 >= argc) { a.bad = true; break; }
      a.root = argv[++i];
      continue;
    }
    if (a.command.empty()) a.command = std::string(t);
    else a.rest.emplace_back(t);
  }
  if (a.command.empty() && !a.help) a.bad = true;
  return a;
}

static size_t arity(const std::string& cmd) {
  if (cmd == "get" || cmd == "migrate") return 1;
  if (cmd == "create" || cmd == "close" || cmd == "reopen" || cmd == "remove") return 2;
  return 0;
}

static int report(const Status& st) {
  if (st.ok()) return 0;
  spdlog::error("{}: {}", errc_name(st.code), st.message);
  return 1;
}

static void print_entry(const IndexedEntry& e) {
  fmt::print("[{}]\n", e.key);
  for (const auto& [id, st] : e.records) fmt::print("{} = {}\n", id, to_string(st));
}

static int cmd_init(const fs::path& dir) {
  auto p = dir / kConfigFileName;
  std::error_code ec;
  if (fs::exists(p, ec)) {
    spdlog::error("{} already exists", p.string());
    return 1;
  }
  std::string err;
  if (!ensure_dir(dir, &err) || !write_file_atomic(p, generate_default_config(), &err)) {
    spdlog::error("{}", err);
    return 1;
  }
  spdlog::info("Created {}", p.string());
  return 0;
}

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto args = parse_args(argc, argv);
  if (args.help || args.bad) {
    print_usage(argv[0]);
    return args.bad ? 2 : 0;
  }
  if (args.command == "init") return cmd_init(args.root);

  if (arity(args.command) != args.rest.size()) {
    spdlog::error("{}: expected {} argument(s)", args.command, arity(args.command));
    print_usage(argv[0]);
    return 2;
  }

  auto cfg_path = find_config_file(args.root);
  if (!cfg_path) {
    spdlog::error("No {} file found from {}", kConfigFileName, args.root.string());
    return 1;
  }

  Config cfg;
  try {
    cfg = Config::Load(*cfg_path, *spdlog::default_logger());
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  auto log = make_logger(cfg, args.verbose);
  spdlog::set_default_logger(log);

  // check работает прямо по диску, индекс ему не нужен
  if (args.command == "check") {
    auto rep = check_integrity(cfg.issue_root(), issue_exists);
    for (const auto& id : rep.evicted_ids) fmt::print("Evicted: {}\n", id);
    if (rep.evicted == 0)
      fmt::print("All {} cached entries map to existing issues\n", rep.checked);
    else
      fmt::print("Evicted {} stale entries (of {} checked)\n", rep.evicted, rep.checked);
    return report(rep.status);
  }

  IssueIndex index({.issue_root = cfg.issue_root(),
                    .hash_length = cfg.key_length,
                    .logger = log});

  // хвост прерванной миграции или правка key_length вне процесса
  if (args.command != "migrate") {
    auto rep = index.on_config_change(cfg);
    if (!rep.status.ok()) return report(rep.status);
  }

  const auto& cmd = args.command;
  if (cmd == "get") {
    auto r = index.get(args.rest[0]);
    if (!r.status.ok()) return report(r.status);
    if (!r.entry) {
      fmt::print("No issues indexed for {}\n", args.rest[0]);
      return 0;
    }
    print_entry(*r.entry);
    return 0;
  }
  if (cmd == "create") return report(index.create(args.rest[0], args.rest[1]));

  // ленивые операции: сбрасываем сразу, чтобы код возврата отражал запись
  auto lazy = [&](Status st) { return report(st.ok() ? index.flush() : st); };
  if (cmd == "close")  return lazy(index.close(args.rest[0], args.rest[1]));
  if (cmd == "reopen") return lazy(index.reopen(args.rest[0], args.rest[1]));
  if (cmd == "remove") return lazy(index.remove(args.rest[0], args.rest[1]));

  if (cmd == "list") {
    auto scan = index.full_scan();
    if (!scan.status.ok()) return report(scan.status);
    bool first = true;
    for (const auto& [key, e] : index.all_entries()) {
      if (!first) fmt::print("\n");
      first = false;
      print_entry(e);
    }
    spdlog::info("{} entries", scan.count);
    return 0;
  }

  if (cmd == "migrate") {
    auto n = parse_hash_length(args.rest[0]);
    if (!n) {
      spdlog::error("migrate: bad length '{}'", args.rest[0]);
      return 2;
    }
    if (clamp_hash_length(*n) != clamp_hash_length(cfg.key_length))
      spdlog::warn("[index] key_length in {} is {}; the next run will migrate back",
                   cfg.path.string(), cfg.key_length);
    auto rep = index.migrate(*n);
    if (rep.status.ok() && !rep.performed)
      spdlog::info("Nothing to migrate; hash length is {}", index.hash_length());
    return report(rep.status);
  }

  spdlog::warn("Unknown command: {}", cmd);
  print_usage(argv[0]);
  return 2;
}
