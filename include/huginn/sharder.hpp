#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace huginn {

constexpr int kMinHashLength = 16;
constexpr int kMaxHashLength = 64; // полный SHA-256 в hex
constexpr std::size_t kFanoutPrefix = 3;

constexpr const char* kIndexDirName = ".index";

int clamp_hash_length(int n);

// Десятичное целое из аргумента CLI: nullopt для пустой строки, мусора
// и значений вне int. Диапазон [16, 64] не проверяется, это дело clamp.
std::optional<int> parse_hash_length(std::string_view s);

// SHA-256(key) в hex, обрезанный до clamp(hash_length) символов.
// Бросает std::runtime_error, если EVP недоступен.
std::string compute_hash(std::string_view key, int hash_length);

// <issue_root>/.index
std::filesystem::path index_dir(const std::filesystem::path& issue_root);
// <issue_root>/.index/<hash[0:3]>/<hash>
std::filesystem::path shard_path(const std::filesystem::path& issue_root,
                                 const std::string& shard_hash);

// Имя файла похоже на шард: 16..64 символов [0-9a-f]
bool is_shard_name(std::string_view name);

} // namespace huginn
