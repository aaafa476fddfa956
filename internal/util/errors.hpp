#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ducksql::util {

/*
  Central error types.

  Engine failures (parse, bind, constraint, I/O) are not listed here: they
  reach the caller as the engine's own exception types.
*/

class MissingQuery : public std::runtime_error {
 public:
  MissingQuery() : std::runtime_error("No query provided to execute. Please use Query() or Func()") {
  }
};

class NoResults : public std::runtime_error {
 public:
  NoResults() : std::runtime_error("Expected at least one row in the result set but none was returned") {
  }
};

class UnknownColumn : public std::runtime_error {
 public:
  using ColumnList = std::vector<std::pair<std::string, std::string>>;

  UnknownColumn(std::string column, std::string expected_type, ColumnList available);

  const std::string& Column() const {
    return column_;
  }
  const std::string& ExpectedType() const {
    return expected_type_;
  }
  const ColumnList& Available() const {
    return available_;
  }

 private:
  std::string column_;
  std::string expected_type_;
  ColumnList  available_;
};

class OperationCancelled : public std::runtime_error {
 public:
  explicit OperationCancelled(const std::string& stage) : std::runtime_error("Operation cancelled during " + stage) {
  }
};

// Field access that the stored value cannot satisfy: NULL or a type mismatch.
class InvalidCast : public std::runtime_error {
 public:
  explicit InvalidCast(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A blob stream yielded fewer bytes than its declared length.
class ShortRead : public std::runtime_error {
 public:
  explicit ShortRead(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ducksql::util
