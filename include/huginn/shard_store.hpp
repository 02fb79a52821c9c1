#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <huginn/entry.hpp>
#include <huginn/status.hpp>

namespace huginn {

struct ShardFile {
  std::filesystem::path path;
  std::string shard_hash; // имя файла
};

struct ShardRead {
  bool found = false;
  ShardEntries entries;
  uint64_t fingerprint = 0; // XXH64 прочитанного текста
  Status status;
};

ShardRead read_shard(const std::filesystem::path& p);

// Пустой content -> файл удаляется, иначе атомарная запись
Status write_shard_content(const std::filesystem::path& p, std::string_view content);

// Пустой набор записей -> файл удаляется. fingerprint (если передан)
// получает XXH64 записанного текста, 0 при удалении.
Status write_shard(const std::filesystem::path& p, const ShardEntries& entries,
                   uint64_t* fingerprint = nullptr);

// Все шарды .index/<prefix>/<hash>, по возрастанию пути.
// Несуществующий .index: пустой список без ошибки.
std::vector<ShardFile> list_shard_files(const std::filesystem::path& issue_root,
                                        Status* status = nullptr);

std::vector<std::filesystem::path> list_fanout_dirs(const std::filesystem::path& issue_root);

// Удаляет пустые каталоги-префиксы, возвращает их количество
size_t prune_empty_fanout_dirs(const std::filesystem::path& issue_root);

// .index/.gitignore с "*"
bool ensure_ignore_marker(const std::filesystem::path& issue_root, std::string* err);

} // namespace huginn
