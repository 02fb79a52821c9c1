#pragma once
#include <memory>

#include <spdlog/logger.h>

#include <huginn/config.hpp>

namespace huginn {

// Логгер "huginn": stderr всегда, плюс ротируемый файл, если
// [logging] enabled = true. Ошибка открытия файла -> только stderr.
std::shared_ptr<spdlog::logger> make_logger(const Config& cfg, bool verbose = false);

} // namespace huginn
