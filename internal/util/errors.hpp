#pragma once

#include <stdexcept>
#include <string>

namespace schemadb::util {

/*
  Central error types.

  ConfigurationError is raised synchronously for caller/programming mistakes
  (identity operation on a key-less table, unknown column, bad identifier,
  invalid schema). Engine failures never leave the public API as exceptions;
  they are converted to db::Result envelopes.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace schemadb::util
