// source/index.cpp
#include <huginn/index.hpp>
#include <huginn/shard_codec.hpp>
#include <huginn/shard_store.hpp>
#include <huginn/sharder.hpp>
#include <huginn/util.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace fs = std::filesystem;

namespace huginn {

struct Bucket {
  ShardEntries entries;
  uint64_t disk_fingerprint = 0; // XXH64 текста на диске; 0: файла нет
};

struct IssueIndex::Impl {
  IndexOptions opts;
  std::shared_ptr<spdlog::logger> log;
  int hash_length = kMinHashLength;

  // shard_hash -> записи шарда
  std::unordered_map<std::string, Bucket> cache;

  // Флаги сессии (живут, пока жив экземпляр)
  bool collision_alerted = false;
  bool ignore_marker_written = false;

  // ---- helpers ----

  Status available() const {
    if (opts.issue_root.empty())
      return Status::Error(Errc::NotAvailable, "issue index: no issue root configured");
    return Status::Ok();
  }

  std::string hash_of(const std::string& key) const { return compute_hash(key, hash_length); }

  // Бакет из кэша, иначе с диска (и в кэш). nullptr + ok: шарда нет.
  Bucket* load_bucket(const std::string& hash, Status& st) {
    st = Status::Ok();
    auto it = cache.find(hash);
    if (it != cache.end()) return &it->second;

    auto r = read_shard(shard_path(opts.issue_root, hash));
    if (!r.status.ok()) {
      st = r.status;
      return nullptr;
    }
    if (!r.found) return nullptr;

    log->debug("loaded shard {} ({} entries)", hash, r.entries.size());
    auto& b = cache[hash];
    b.entries = std::move(r.entries);
    b.disk_fingerprint = r.fingerprint;
    return &b;
  }

  IndexedEntry* find_entry(const std::string& key, Status& st) {
    st = available();
    if (!st.ok()) return nullptr;
    auto* b = load_bucket(hash_of(key), st);
    if (!b) return nullptr;
    auto it = b->entries.find(key);
    return it == b->entries.end() ? nullptr : &it->second;
  }

  size_t dirty_count() const {
    size_t n = 0;
    for (const auto& [h, b] : cache)
      for (const auto& [k, e] : b.entries)
        if (e.dirty) ++n;
    return n;
  }

  void alert_collision() {
    if (collision_alerted) return;
    collision_alerted = true;
    log->warn("Hash collision detected in issue index. "
              "Consider increasing index.key_length in your .huginn config.");
  }

  void ensure_marker() {
    if (ignore_marker_written) return;
    ignore_marker_written = true;
    std::string err;
    if (!ensure_ignore_marker(opts.issue_root, &err))
      log->warn("issue index: cannot write ignore marker: {}", err);
  }

  // Пишет бакет целиком, пустой: удаляет файл. При успехе снимает dirty
  // и выкидывает опустевшие записи.
  Status write_bucket(const std::string& hash, Bucket& b) {
    const auto content = serialize_shard(b.entries);
    const uint64_t fp = content.empty() ? 0 : content_fingerprint(content);

    if (fp != 0 && fp == b.disk_fingerprint) {
      log->debug("shard {} unchanged, write skipped", hash);
    } else {
      if (!content.empty()) ensure_marker();
      auto st = write_shard_content(shard_path(opts.issue_root, hash), content);
      if (!st.ok()) return st;
      if (content.empty()) log->debug("removed empty shard {}", hash);
      else log->debug("wrote shard {}", hash);
    }

    b.disk_fingerprint = fp;
    for (auto it = b.entries.begin(); it != b.entries.end();) {
      if (it->second.empty()) {
        it = b.entries.erase(it);
      } else {
        it->second.dirty = false;
        ++it;
      }
    }
    return Status::Ok();
  }

  Impl(IndexOptions o) : opts(std::move(o)) {
    log = opts.logger ? opts.logger : spdlog::default_logger();
    hash_length = clamp_hash_length(opts.hash_length);
  }
};

// ===== IssueIndex API =====

IssueIndex::IssueIndex(IndexOptions opts) : p_(new Impl(std::move(opts))) {}

IssueIndex::~IssueIndex() {
  if (!p_) return;

  // отложенные transition/remove не должны потеряться
  if (p_->opts.flush_on_close && p_->available().ok() && p_->dirty_count() > 0) {
    try {
      auto st = flush();
      if (!st.ok()) p_->log->error("final index flush failed: {}", st.message);
    } catch (const std::exception& e) {
      p_->log->error("final index flush failed: {}", e.what());
    }
  }

  delete p_;
  p_ = nullptr;
}

GetResult IssueIndex::get(const std::string& key) {
  GetResult r;
  auto* e = p_->find_entry(key, r.status);
  if (e) r.entry = *e;
  return r;
}

Status IssueIndex::create(const std::string& key, const std::string& record_id) {
  auto st = p_->available();
  if (!st.ok()) return st;

  // иначе запись уйдёт на диск, но после перезапуска не прочитается
  if (!is_valid_key(key))
    return Status::Error(Errc::InvalidArgument, "index key cannot be stored: empty or multi-line");
  if (!is_valid_record_id(record_id))
    return Status::Error(Errc::InvalidArgument, "issue id cannot be stored: '" + record_id + "'");

  const auto hash = p_->hash_of(key);
  Bucket* cached = p_->load_bucket(hash, st);
  if (!st.ok()) return st;

  // Работаем с копией: если запись на диск упадёт, кэш остаётся прежним
  Bucket candidate = cached ? *cached : Bucket{};
  auto& entry = candidate.entries.try_emplace(key, key).first->second;
  entry.set(record_id, RecordStatus::Open);
  entry.dirty = true;

  if (candidate.entries.size() > 1) p_->alert_collision();

  st = p_->write_bucket(hash, candidate);
  if (!st.ok()) {
    p_->log->error("index create failed for {} ({}): {}", key, record_id, st.message);
    return st;
  }
  p_->cache[hash] = std::move(candidate);
  return Status::Ok();
}

Status IssueIndex::transition(const std::string& key, const std::string& record_id,
                              RecordStatus status) {
  Status st;
  auto* e = p_->find_entry(key, st);
  if (!st.ok()) return st;
  if (!e) return Status::Error(Errc::NotFound, "no index entry for " + key);
  if (!e->has(record_id))
    return Status::Error(Errc::NotFound, "issue " + record_id + " not indexed for " + key);

  e->set(record_id, status);
  return Status::Ok();
}

Status IssueIndex::close(const std::string& key, const std::string& record_id) {
  return transition(key, record_id, RecordStatus::Closed);
}

Status IssueIndex::reopen(const std::string& key, const std::string& record_id) {
  return transition(key, record_id, RecordStatus::Open);
}

Status IssueIndex::remove(const std::string& key, const std::string& record_id) {
  Status st;
  auto* e = p_->find_entry(key, st);
  if (!st.ok()) return st;
  if (!e) return Status::Error(Errc::NotFound, "no index entry for " + key);

  e->remove(record_id);
  return Status::Ok();
}

Status IssueIndex::flush() {
  auto st = p_->available();
  if (!st.ok()) return st;

  Status first;
  for (auto& [hash, b] : p_->cache) {
    bool dirty = std::any_of(b.entries.begin(), b.entries.end(),
                             [](const auto& kv) { return kv.second.dirty; });
    if (!dirty) continue;

    auto ws = p_->write_bucket(hash, b);
    if (!ws.ok()) {
      p_->log->error("index flush failed for shard {}: {}", hash, ws.message);
      if (first.ok()) first = ws;
    }
  }
  return first;
}

ScanResult IssueIndex::full_scan() {
  ScanResult res;
  res.status = p_->available();
  if (!res.status.ok()) return res;

  if (auto pending = p_->dirty_count())
    p_->log->warn("full scan discards {} unflushed index entries", pending);
  p_->cache.clear();

  auto files = list_shard_files(p_->opts.issue_root, &res.status);
  for (const auto& f : files) {
    auto r = read_shard(f.path);
    if (!r.found) {
      if (!r.status.ok() && res.status.ok()) res.status = r.status;
      continue;
    }
    res.count += r.entries.size();
    auto& b = p_->cache[f.shard_hash];
    b.entries = std::move(r.entries);
    b.disk_fingerprint = r.fingerprint;
  }

  p_->log->debug("full scan: {} entries in {} shards", res.count, files.size());
  return res;
}

std::map<std::string, IndexedEntry> IssueIndex::all_entries() const {
  std::map<std::string, IndexedEntry> out;
  const auto cur = static_cast<size_t>(p_->hash_length);
  for (const auto& [hash, b] : p_->cache) {
    for (const auto& [key, e] : b.entries) {
      // после прерванной миграции ключ может встретиться дважды:
      // шард текущей длины главнее
      if (hash.size() == cur) out.insert_or_assign(key, e);
      else out.emplace(key, e);
    }
  }
  return out;
}

size_t IssueIndex::dirty_count() const { return p_->dirty_count(); }

MigrationReport IssueIndex::migrate(int new_hash_length) {
  MigrationReport rep;
  rep.status = p_->available();
  if (!rep.status.ok()) return rep;

  const int target = clamp_hash_length(new_hash_length);

  // ленивые изменения пишем под старой длиной, иначе проход 1 их не увидит
  auto fst = flush();
  if (!fst.ok()) {
    p_->log->error("Index migration aborted: pending changes not flushed: {}", fst.message);
    rep.status = Status::Error(Errc::MigrationFailure, fst.message);
    return rep;
  }

  const auto& root = p_->opts.issue_root;
  if (!needs_migration(root, target)) {
    if (target != p_->hash_length) {
      p_->cache.clear();
      p_->hash_length = target;
      p_->log->info("index hash length set to {}", target);
    }
    return rep;
  }

  // Длина уже целевая, но на диске хвост прерванной миграции: живыми
  // считаются ещё не перенесённые копии
  const int source = p_->hash_length == target ? 0 : p_->hash_length;

  Status st;
  auto plan = build_migration_plan(root, target, source, &st);
  if (!st.ok()) {
    p_->log->error("Index migration aborted while reading shards: {}", st.message);
    rep.status = st;
    return rep;
  }

  rep = execute_migration(root, plan, *p_->log);
  if (!rep.status.ok()) return rep;

  p_->hash_length = target;
  if (rep.had_collision) p_->alert_collision();

  auto scan = full_scan();
  if (!scan.status.ok()) rep.status = scan.status;
  return rep;
}

MigrationReport IssueIndex::on_config_change(const Config& cfg) {
  MigrationReport rep;
  rep.status = p_->available();
  if (!rep.status.ok()) return rep;

  const int target = clamp_hash_length(cfg.key_length);
  if (target == p_->hash_length && !needs_migration(p_->opts.issue_root, target)) return rep;

  p_->log->info("index key_length changed: {} -> {}", p_->hash_length, target);
  return migrate(target);
}

int IssueIndex::hash_length() const { return p_->hash_length; }

const fs::path& IssueIndex::issue_root() const { return p_->opts.issue_root; }

bool IssueIndex::collision_alerted() const { return p_->collision_alerted; }

} // namespace huginn
