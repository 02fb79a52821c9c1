#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace huginn {

std::string trim(std::string_view s);

// mkdir -p; false + err при неудаче (в т.ч. если по пути лежит обычный файл)
bool ensure_dir(const std::filesystem::path& p, std::string* err);

// Чтение целиком. nullopt, если файла нет; err заполняется только при
// реальной ошибке чтения.
std::optional<std::string> read_file(const std::filesystem::path& p, std::string* err);

// tmp + fsync + rename + fsync каталога
bool write_file_atomic(const std::filesystem::path& p, std::string_view content, std::string* err);

// unlink; отсутствие файла не ошибка
bool remove_file(const std::filesystem::path& p, std::string* err);

// XXH64(content), seed=0
uint64_t content_fingerprint(std::string_view content);

} // namespace huginn
