#pragma once

#include <stdexcept>
#include <string>

namespace jobq::util {

/*
  Central error types.

  Store-level errors (AlreadyExists, NotFound, InvalidState, ValidationError)
  surface to administrative callers. Execution errors (ExecutionTimeout,
  LaunchError) are raised by command executors and stay inside the worker loop.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Enqueue with an id that already exists.
class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operation not valid for the job's current state (lost race or bug).
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutionTimeout : public std::runtime_error {
 public:
  ExecutionTimeout(const std::string& msg, double elapsed_seconds) : std::runtime_error(msg), elapsed_seconds_(elapsed_seconds) {
  }

  double elapsed_seconds() const {
    return elapsed_seconds_;
  }

 private:
  double elapsed_seconds_;
};

class LaunchError : public std::runtime_error {
 public:
  explicit LaunchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobq::util
