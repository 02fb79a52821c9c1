#include <huginn/integrity.hpp>
#include <huginn/shard_store.hpp>

namespace fs = std::filesystem;

namespace huginn {

IntegrityReport check_integrity(const fs::path& issue_root, const ExistsPredicate& exists) {
  IntegrityReport rep;
  auto remember = [&](const Status& st) {
    if (!st.ok() && rep.status.ok()) rep.status = st;
  };

  Status list_st;
  auto files = list_shard_files(issue_root, &list_st);
  remember(list_st);

  for (const auto& f : files) {
    auto r = read_shard(f.path);
    if (!r.found) {
      remember(r.status);
      continue;
    }

    bool dirty = false;
    for (auto& [key, entry] : r.entries) {
      std::vector<std::string> stale;
      for (const auto& [id, st] : entry.records) {
        ++rep.checked;
        if (!exists(issue_root, id)) stale.push_back(id);
      }
      for (const auto& id : stale) {
        entry.remove(id);
        ++rep.evicted;
        rep.evicted_ids.push_back(id);
        dirty = true;
      }
    }

    // пустой набор -> write_shard удалит файл
    if (dirty) remember(write_shard(f.path, r.entries));
  }
  return rep;
}

} // namespace huginn
