#include <huginn/migration.hpp>
#include <huginn/shard_store.hpp>
#include <huginn/sharder.hpp>
#include <huginn/util.hpp>

#include <set>

namespace fs = std::filesystem;

namespace huginn {

bool needs_migration(const fs::path& issue_root, int target_hash_length) {
  const auto target = static_cast<size_t>(clamp_hash_length(target_hash_length));
  for (const auto& f : list_shard_files(issue_root)) {
    if (f.shard_hash.size() != target) return true;
  }
  return false;
}

MigrationPlan build_migration_plan(const fs::path& issue_root, int new_hash_length,
                                   int source_hash_length, Status* status) {
  MigrationPlan plan;
  plan.hash_length = clamp_hash_length(new_hash_length);
  plan.source_length = source_hash_length;

  Status st;
  auto files = list_shard_files(issue_root, &st);
  if (!st.ok()) {
    if (status) *status = st;
    return plan;
  }

  for (const auto& f : files) {
    auto r = read_shard(f.path);
    if (!r.status.ok()) {
      if (status) *status = r.status;
      return plan;
    }
    if (!r.found) continue; // исчез между листингом и чтением
    plan.old_files.push_back(f.path);

    for (auto& [key, entry] : r.entries) {
      auto new_hash = compute_hash(key, plan.hash_length);
      plan.groups[new_hash].push_back(plan.items.size());
      plan.items.push_back({f.path, std::move(new_hash), key, std::move(entry)});
    }
  }
  if (status) *status = Status::Ok();
  return plan;
}

// Один и тот же ключ может лежать в нескольких старых шардах после
// прерванной миграции. Источник истины: копия под текущей длиной индекса,
// затем: ещё не перенесённая копия; уже перенесённая считается устаревшей.
static int copy_rank(const MigrationPlan& plan, const MigrationItem& it) {
  const auto name = it.old_path.filename().string();
  if (plan.source_length > 0 && name.size() == static_cast<size_t>(plan.source_length)) return 2;
  if (name != it.new_shard_hash) return 1;
  return 0;
}

MigrationReport execute_migration(const fs::path& issue_root, const MigrationPlan& plan,
                                  spdlog::logger& log) {
  MigrationReport rep;
  rep.performed = true;
  rep.entries = plan.items.size();

  std::set<fs::path> written;

  for (const auto& [new_hash, indices] : plan.groups) {
    ShardEntries merged;
    std::map<std::string, int> rank;

    for (size_t idx : indices) {
      const auto& item = plan.items[idx];
      const int r = copy_rank(plan, item);
      auto it = rank.find(item.key);
      if (it != rank.end() && it->second >= r) continue;
      rank[item.key] = r;
      auto e = item.entry;
      e.dirty = false;
      merged.insert_or_assign(item.key, std::move(e));
    }

    if (merged.size() > 1) rep.had_collision = true;

    const auto new_path = shard_path(issue_root, new_hash);
    auto st = write_shard(new_path, merged);
    if (!st.ok()) {
      log.error("Index migration failed: {}", st.message);
      rep.status = Status::Error(Errc::MigrationFailure, st.message);
      return rep;
    }
    written.insert(new_path);
    ++rep.shards_written;
    log.debug("migrated {} key(s) -> {}", merged.size(), new_path.string());
  }

  for (const auto& old : plan.old_files) {
    if (written.count(old)) continue;
    std::string err;
    if (!remove_file(old, &err)) {
      // данные уже продублированы в новом шарде; повторная миграция доберёт
      log.warn("Index migration: {}", err);
      continue;
    }
    ++rep.shards_removed;
  }

  rep.dirs_pruned = prune_empty_fanout_dirs(issue_root);
  log.info("Index migrated to hash length {}: {} entries, {} shards written, {} removed",
           plan.hash_length, rep.entries, rep.shards_written, rep.shards_removed);
  return rep;
}

} // namespace huginn
