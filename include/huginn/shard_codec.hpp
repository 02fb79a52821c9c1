#pragma once
#include <string>
#include <string_view>

#include <huginn/entry.hpp>

namespace huginn {

// Формат шарда:
//
//   [src/a.x]
//   20260110_111401 = open
//   20260110_111402 = closed
//
//   [src/b.x]
//   20260110_111403 = open
//
// Неизвестные статусы молча пропускаются; секции без валидных записей
// не возвращаются. Все записи на выходе parse() чистые (dirty=false).
ShardEntries parse_shard(std::string_view content);

// Только непустые записи, секции и id отсортированы, между секциями пустая
// строка. Пустой вход -> "".
std::string serialize_shard(const ShardEntries& entries);

bool has_records(const ShardEntries& entries);

// Что parse_shard() прочитает обратно без потерь.
// key: непустой, без перевода строки.
// record_id: непустой, без пробельных символов и '=', не начинается с '#' или ';'.
bool is_valid_key(std::string_view key);
bool is_valid_record_id(std::string_view record_id);

} // namespace huginn
