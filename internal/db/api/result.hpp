#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/value.hpp"

namespace schemadb::db {

/*
  Portable result codes.

  Every public storage operation returns a Result; SQLite error codes
  never reach callers directly.
*/

enum class StatusCode : int {
  // non-fatal: backup destination had no previous file to remove
  NoExistingBackup = -4082,

  OK            = 200,
  NotFound      = 404,
  Conflict      = 409,
  Busy          = 429,
  InternalError = 500,
};

struct Result {
  StatusCode code   = StatusCode::OK;
  bool       status = false;

  std::optional<std::int64_t>     changes;
  std::optional<model::Value>     value;
  std::vector<model::Row>         rows;
  std::optional<model::Row>       row;
  std::vector<model::ColumnInfo>  info;

  std::string message;

  static Result Ok() {
    Result r;
    r.status = true;
    return r;
  }

  static Result Changed(std::int64_t changes) {
    Result r;
    r.status  = changes > 0;
    r.changes = changes;
    return r;
  }

  static Result Err(StatusCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  // request was processed by the engine (status may still be false)
  bool Succeeded() const {
    return code == StatusCode::OK;
  }

  explicit operator bool() const {
    return code == StatusCode::OK && status;
  }
};

inline int ToInt(StatusCode code) {
  return static_cast<int>(code);
}

} // namespace schemadb::db
