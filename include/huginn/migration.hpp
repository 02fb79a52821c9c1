#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <huginn/entry.hpp>
#include <huginn/status.hpp>

#include <spdlog/logger.h>

namespace huginn {

struct MigrationItem {
  std::filesystem::path old_path;
  std::string new_shard_hash;
  std::string key;
  IndexedEntry entry;
};

struct MigrationPlan {
  int hash_length = 0;   // целевая длина (уже clamp)
  int source_length = 0; // длина, под которой индекс живёт сейчас; 0, если неизвестна
  std::vector<MigrationItem> items;
  std::map<std::string, std::vector<size_t>> groups; // new hash -> индексы items
  std::vector<std::filesystem::path> old_files;       // все прочитанные шарды
};

struct MigrationReport {
  bool performed = false;
  size_t entries = 0;
  size_t shards_written = 0;
  size_t shards_removed = 0;
  size_t dirs_pruned = 0;
  bool had_collision = false;
  Status status;
};

// true, если хоть одно имя шарда не совпадает по длине с целевой
bool needs_migration(const std::filesystem::path& issue_root, int target_hash_length);

// Проход 1: только чтение. Любая ошибка чтения прерывает построение плана,
// так как иначе нечитаемый шард был бы удалён во втором проходе.
MigrationPlan build_migration_plan(const std::filesystem::path& issue_root,
                                   int new_hash_length, int source_hash_length,
                                   Status* status);

// Проход 2: пишет слитые шарды, затем удаляет старые и пустые префиксы.
// При ошибке записи: MigrationFailure, уже записанное остаётся,
// старые файлы не трогаются.
MigrationReport execute_migration(const std::filesystem::path& issue_root,
                                  const MigrationPlan& plan,
                                  spdlog::logger& log);

} // namespace huginn
