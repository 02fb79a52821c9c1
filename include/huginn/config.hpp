#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace huginn {

constexpr const char* kConfigFileName = ".huginn";

struct LoggingConfig {
  bool enabled = false;
  std::string filepath = ".huginnlog";
};

struct Config {
  std::filesystem::path path; // абсолютный путь к .huginn
  std::filesystem::path cwd;  // каталог, где лежит .huginn

  // [plugin]
  std::string issue_dir = "issues";
  // [index]
  int key_length = 16;
  // [logging]
  LoggingConfig logging;

  std::filesystem::path issue_root() const;
  std::filesystem::path log_path() const;

  // Неизвестные секции/ключи и невалидные значения: warn + значение
  // по умолчанию. Нет файла -> std::runtime_error.
  static Config Load(const std::filesystem::path& p, spdlog::logger& log);
};

// Ищет .huginn от start вверх до корня ФС
std::optional<std::filesystem::path> find_config_file(const std::filesystem::path& start);

// Содержимое .huginn для init: все опции закомментированы
std::string generate_default_config();

// Держит активную конфигурацию и рассылает её после перечитывания.
class Context {
public:
  using Listener = std::function<void(const Config&)>;

  Context(Config cfg, std::shared_ptr<spdlog::logger> log);

  const Config& config() const { return cfg_; }
  const std::shared_ptr<spdlog::logger>& logger() const { return log_; }

  void on_config_change(Listener fn);

  // Перечитать cfg_.path; при ошибке: warn, конфигурация не меняется
  bool reload();

private:
  Config cfg_;
  std::shared_ptr<spdlog::logger> log_;
  std::vector<Listener> listeners_;
};

} // namespace huginn
