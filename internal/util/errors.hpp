#pragma once

#include <stdexcept>
#include <string>

namespace aiknowsys::util {

/*
  Errors the knowledge base raises on purpose.

  Commands turn these into a message on stderr and exit status 2; anything
  else reaching main() is a bug and is logged as such.
*/
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed caller input (date, status, scope, empty query, bad slug). Raised before any I/O.
class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& msg) : Error(msg) {
  }
};

// Index file, database or pattern ledger cannot be created, opened or written.
class StorageUnavailable : public Error {
 public:
  explicit StorageUnavailable(const std::string& msg) : Error(msg) {
  }
};

// A StorageAdapter method the backend does not provide.
class NotImplemented : public Error {
 public:
  explicit NotImplemented(const std::string& msg) : Error(msg) {
  }
};

} // namespace aiknowsys::util
