#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace huginn {

enum class RecordStatus : unsigned char { Open, Closed };

const char* to_string(RecordStatus s);
// "open" / "closed"; всё остальное -> nullopt
std::optional<RecordStatus> parse_status(std::string_view s);

// Связь одного файла с issue. key: исходный относительный путь,
// даже если в том же шарде лежат чужие (коллизионные) записи.
struct IndexedEntry {
  std::string key;
  std::map<std::string, RecordStatus> records;
  bool dirty = false;

  IndexedEntry() = default;
  explicit IndexedEntry(std::string k) : key(std::move(k)) {}

  // true, если что-то поменялось (тогда же выставляется dirty)
  bool set(const std::string& record_id, RecordStatus s);
  bool remove(const std::string& record_id);

  bool has(const std::string& record_id) const { return records.count(record_id) != 0; }
  bool empty() const { return records.empty(); }
  std::optional<RecordStatus> status_of(const std::string& record_id) const;
};

// Содержимое одного шарда: key -> entry
using ShardEntries = std::map<std::string, IndexedEntry>;

} // namespace huginn
