#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include <huginn/config.hpp>
#include <huginn/entry.hpp>
#include <huginn/migration.hpp>
#include <huginn/status.hpp>

namespace huginn {

struct IndexOptions {
  // <cwd>/<issue_dir>; пусто -> все операции возвращают NotAvailable
  std::filesystem::path issue_root;

  int hash_length = 16; // clamp в [16, 64]

  // Сбросить отложенные изменения в деструкторе
  bool flush_on_close = true;

  // nullptr -> spdlog::default_logger()
  std::shared_ptr<spdlog::logger> logger;
};

struct GetResult {
  std::optional<IndexedEntry> entry; // nullopt + ok: просто нет записи
  Status status;
};

struct ScanResult {
  size_t count = 0; // число записей (не файлов)
  Status status;
};

// Индекс файл -> issue. Один владелец на корень, без потоков.
//
// create пишет шард сразу (write-through), transition/remove копятся
// в кэше до flush(), migrate пересобирает шарды под новую длину хеша.
class IssueIndex {
public:
  explicit IssueIndex(IndexOptions opts);
  ~IssueIndex();

  IssueIndex(const IssueIndex &) = delete;
  IssueIndex &operator=(const IssueIndex &) = delete;

  GetResult get(const std::string& key);

  Status create(const std::string& key, const std::string& record_id);
  Status transition(const std::string& key, const std::string& record_id, RecordStatus status);
  Status close(const std::string& key, const std::string& record_id);
  Status reopen(const std::string& key, const std::string& record_id);
  Status remove(const std::string& key, const std::string& record_id);

  Status flush();
  ScanResult full_scan();

  // Свежая копия, с кэшем не связана
  std::map<std::string, IndexedEntry> all_entries() const;
  size_t dirty_count() const;

  MigrationReport migrate(int new_hash_length);
  // Слушатель Context: мигрирует, если изменился [index] key_length
  MigrationReport on_config_change(const Config& cfg);

  int hash_length() const;
  const std::filesystem::path& issue_root() const;
  bool collision_alerted() const;

private:
  struct Impl;
  Impl *p_;
};

} // namespace huginn
