#include <huginn/shard_codec.hpp>
#include <huginn/util.hpp>

#include <cctype>
#include <sstream>

namespace huginn {

// Значение справа от '=': в кавычках: до закрывающей, иначе первое слово
static std::string extract_value(std::string_view rhs) {
  std::string v = trim(rhs);
  if (v.empty()) return v;
  if (v.front() == '"') {
    auto close = v.find('"', 1);
    return close == std::string::npos ? v.substr(1) : v.substr(1, close - 1);
  }
  auto ws = v.find_first_of(" \t");
  return ws == std::string::npos ? v : v.substr(0, ws);
}

ShardEntries parse_shard(std::string_view content) {
  ShardEntries out;
  IndexedEntry* cur = nullptr;

  std::istringstream in{std::string(content)};
  std::string line;
  while (std::getline(in, line)) {
    auto s = trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';') continue;

    if (s.front() == '[' && s.back() == ']' && s.size() > 2) {
      auto key = s.substr(1, s.size() - 2);
      auto it = out.find(key);
      if (it == out.end()) it = out.emplace(key, IndexedEntry{key}).first;
      cur = &it->second;
      continue;
    }
    if (!cur) continue; // строки до первой секции игнорируем

    auto eq = s.find('=');
    if (eq == std::string::npos) continue;
    auto id = trim(std::string_view(s).substr(0, eq));
    if (id.empty() || id.find_first_of(" \t") != std::string::npos) continue;

    auto st = parse_status(extract_value(std::string_view(s).substr(eq + 1)));
    if (!st) continue;
    cur->records[id] = *st;
  }

  for (auto it = out.begin(); it != out.end();) {
    if (it->second.empty()) it = out.erase(it);
    else ++it;
  }
  return out;
}

std::string serialize_shard(const ShardEntries& entries) {
  std::string out;
  bool first = true;
  for (const auto& [key, e] : entries) {
    if (e.empty()) continue;
    if (!first) out += '\n';
    first = false;

    out += '[';
    out += key;
    out += "]\n";
    for (const auto& [id, st] : e.records) {
      out += id;
      out += " = ";
      out += to_string(st);
      out += '\n';
    }
  }
  return out;
}

bool is_valid_key(std::string_view key) {
  return !key.empty() && key.find_first_of("\r\n") == std::string_view::npos;
}

bool is_valid_record_id(std::string_view record_id) {
  if (record_id.empty() || record_id[0] == '#' || record_id[0] == ';') return false;
  for (unsigned char c : record_id) {
    if (c == '=' || std::isspace(c)) return false;
  }
  return true;
}

bool has_records(const ShardEntries& entries) {
  for (const auto& [k, e] : entries)
    if (!e.empty()) return true;
  return false;
}

} // namespace huginn
