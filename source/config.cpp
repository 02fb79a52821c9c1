#include <huginn/config.hpp>
#include <huginn/sharder.hpp>
#include <huginn/util.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace huginn {

// Секции редактора (UI): в .huginn встречаются, индексу не нужны
static const char* const kForeignSections[] = {"annotation", "issue", "show"};

static std::string unquote_value(const std::string& rhs) {
  auto v = trim(rhs);
  if (v.empty()) return v;
  if (v.front() == '"') {
    auto close = v.find('"', 1);
    return close == std::string::npos ? v.substr(1) : v.substr(1, close - 1);
  }
  auto ws = v.find_first_of(" \t");
  return ws == std::string::npos ? v : v.substr(0, ws);
}

static std::optional<int> parse_int(const std::string& v) {
  if (v.empty() || v.size() > 9) return std::nullopt;
  if (!std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); }))
    return std::nullopt;
  return std::stoi(v);
}

static std::optional<bool> parse_bool(const std::string& v) {
  if (v == "true") return true;
  if (v == "false") return false;
  return std::nullopt;
}

fs::path Config::issue_root() const {
  fs::path d = issue_dir;
  return d.is_absolute() ? d : cwd / d;
}

fs::path Config::log_path() const {
  fs::path p = logging.filepath;
  return p.is_absolute() ? p : cwd / p;
}

Config Config::Load(const fs::path& p, spdlog::logger& log) {
  Config c;
  c.path = fs::absolute(p);
  c.cwd = c.path.parent_path();

  std::ifstream in(c.path);
  if (!in) throw std::runtime_error("Config file not found: " + p.string());

  auto invalid = [&](const std::string& section, const std::string& key,
                     const std::string& val, const std::string& def) {
    log.warn("Invalid value for [{}] {}: {} (using default: {})", section, key, val, def);
  };

  std::string section;
  bool skip_section = false;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';') continue;
    if (line.front() == '[' && line.back() == ']') {
      section = trim(line.substr(1, line.size() - 2));
      skip_section = false;
      if (section == "plugin" || section == "index" || section == "logging") continue;
      skip_section = true;
      bool foreign = std::find(std::begin(kForeignSections), std::end(kForeignSections),
                               section) != std::end(kForeignSections);
      if (!foreign) log.warn("Unknown config section: [{}]", section);
      continue;
    }
    if (section.empty() || skip_section) continue;

    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    auto key = trim(line.substr(0, eq));
    auto val = unquote_value(line.substr(eq + 1));
    if (val.empty()) continue;

    if (section == "plugin" && key == "issue_dir") {
      c.issue_dir = val;

    } else if (section == "index" && key == "key_length") {
      auto n = parse_int(val);
      if (n && *n >= kMinHashLength && *n <= kMaxHashLength) c.key_length = *n;
      else invalid(section, key, val, std::to_string(Config{}.key_length));

    } else if (section == "logging" && key == "enabled") {
      auto b = parse_bool(val);
      if (b) c.logging.enabled = *b;
      else invalid(section, key, val, "false");

    } else if (section == "logging" && key == "filepath") {
      c.logging.filepath = val;

    } else {
      log.warn("Unknown config key: [{}] {}", section, key);
    }
  }
  return c;
}

std::optional<fs::path> find_config_file(const fs::path& start) {
  std::error_code ec;
  fs::path dir = fs::absolute(start, ec);
  if (ec) return std::nullopt;
  if (fs::is_regular_file(dir, ec)) dir = dir.parent_path();

  while (true) {
    auto cand = dir / kConfigFileName;
    if (fs::is_regular_file(cand, ec)) return cand;
    auto parent = dir.parent_path();
    if (parent.empty() || parent == dir) return std::nullopt;
    dir = parent;
  }
}

std::string generate_default_config() {
  const Config d;
  std::ostringstream o;
  o << "[plugin]\n"
    << "# issue_dir = " << d.issue_dir << "\n"
    << "\n"
    << "[index]\n"
    << "# key_length = " << d.key_length << "\n"
    << "\n"
    << "[logging]\n"
    << "# enabled = " << (d.logging.enabled ? "true" : "false") << "\n"
    << "# filepath = " << d.logging.filepath << "\n";
  return o.str();
}

Context::Context(Config cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)), log_(std::move(log)) {}

void Context::on_config_change(Listener fn) { listeners_.push_back(std::move(fn)); }

bool Context::reload() {
  Config fresh;
  try {
    fresh = Config::Load(cfg_.path, *log_);
  } catch (const std::exception& e) {
    log_->warn("Config reload failed: {}", e.what());
    return false;
  }
  cfg_ = std::move(fresh);
  for (auto& fn : listeners_) fn(cfg_);
  return true;
}

} // namespace huginn
