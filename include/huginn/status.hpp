#pragma once
#include <string>
#include <utility>

namespace huginn {

enum class Errc {
  Ok = 0,
  NotAvailable,     // не настроен корень индекса
  NotFound,         // нет записи / нет issue id
  InvalidArgument,  // ключ или id не представимы в формате шарда
  IoFailure,        // ошибка чтения/записи на диске
  MigrationFailure, // запись во втором проходе миграции упала
};

struct Status {
  Errc code = Errc::Ok;
  std::string message;

  bool ok() const { return code == Errc::Ok; }
  explicit operator bool() const { return ok(); }

  static Status Ok() { return {}; }
  static Status Error(Errc c, std::string msg) { return {c, std::move(msg)}; }
};

const char* errc_name(Errc c);

} // namespace huginn
