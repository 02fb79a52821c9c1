#include <huginn/logging.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace huginn {

constexpr size_t kLogRotateBytes = 1024 * 1024;
constexpr size_t kLogRotateFiles = 3;

std::shared_ptr<spdlog::logger> make_logger(const Config& cfg, bool verbose) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  std::string file_error;
  if (cfg.logging.enabled) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_path().string(), kLogRotateBytes, kLogRotateFiles));
    } catch (const spdlog::spdlog_ex& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("huginn", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);

  if (!file_error.empty())
    logger->warn("failed to open log file {}, logging to stderr only: {}",
                 cfg.log_path().string(), file_error);
  return logger;
}

} // namespace huginn
