#include <huginn/entry.hpp>
#include <huginn/status.hpp>

namespace huginn {

const char* errc_name(Errc c) {
  switch (c) {
    case Errc::Ok: return "ok";
    case Errc::NotAvailable: return "not available";
    case Errc::NotFound: return "not found";
    case Errc::InvalidArgument: return "invalid argument";
    case Errc::IoFailure: return "io failure";
    case Errc::MigrationFailure: return "migration failure";
  }
  return "unknown";
}

const char* to_string(RecordStatus s) {
  return s == RecordStatus::Closed ? "closed" : "open";
}

std::optional<RecordStatus> parse_status(std::string_view s) {
  if (s == "open") return RecordStatus::Open;
  if (s == "closed") return RecordStatus::Closed;
  return std::nullopt;
}

bool IndexedEntry::set(const std::string& record_id, RecordStatus s) {
  auto it = records.find(record_id);
  if (it != records.end() && it->second == s) return false;
  records[record_id] = s;
  dirty = true;
  return true;
}

bool IndexedEntry::remove(const std::string& record_id) {
  if (records.erase(record_id) == 0) return false;
  dirty = true;
  return true;
}

std::optional<RecordStatus> IndexedEntry::status_of(const std::string& record_id) const {
  auto it = records.find(record_id);
  if (it == records.end()) return std::nullopt;
  return it->second;
}

} // namespace huginn
