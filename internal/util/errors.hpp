#pragma once

#include <stdexcept>
#include <string>

namespace labfleet::util {

/*
  Central error types.

  Per-node kinds (ConnectError, TimeoutError, StaticPlanMiss) are caught by
  the dispatcher and folded into that node's report. Whole-run kinds
  (ParseError, InvalidArgument, NotFound on input files) abort before any
  node work begins. PersistenceError is fatal to the save step only.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConnectError : public std::runtime_error {
 public:
  explicit ConnectError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StaticPlanMiss : public std::runtime_error {
 public:
  explicit StaticPlanMiss(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace labfleet::util
