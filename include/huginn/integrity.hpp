#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <huginn/status.hpp>

namespace huginn {

using ExistsPredicate =
    std::function<bool(const std::filesystem::path& issue_root, const std::string& record_id)>;

struct IntegrityReport {
  size_t checked = 0;
  size_t evicted = 0;
  std::vector<std::string> evicted_ids;
  Status status; // первая ошибка перезаписи/удаления шарда
};

// Работает только с диском: кэш индекса не трогает и не требует.
// Шард с вытесненными записями перезаписывается, пустой: удаляется.
IntegrityReport check_integrity(const std::filesystem::path& issue_root,
                                const ExistsPredicate& exists);

} // namespace huginn
