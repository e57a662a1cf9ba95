#pragma once

#include <stdexcept>
#include <string>

namespace gemfeed::util {

/*
  Central error types.

  Stores translate db::Result codes into these; anything else
  (I/O, corruption, driver failures) surfaces as std::runtime_error.
*/

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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace gemfeed::util
