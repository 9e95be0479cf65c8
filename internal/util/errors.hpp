#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace rowqueue::util {

/*
  Central error types.

  Store results (db::Result) are translated into these by the queue layer.
  Job outcomes are NOT errors; see queue/outcome.hpp.
*/

class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  StoreError(db::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  db::ErrorCode code() const {
    return code_;
  }

 private:
  db::ErrorCode code_;
};

// Raised by job actions (or the code driving them) when an external interrupt
// such as SIGINT arrives mid-job.
class Interrupted : public std::runtime_error {
 public:
  explicit Interrupted(const std::string& msg = "interrupted") : std::runtime_error(msg) {
  }
};

// Throws the matching exception for a non-OK store result.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// what() of a captured exception, for logs.
std::string Describe(const std::exception_ptr& error);

} // namespace rowqueue::util
