#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/connection.hpp"

namespace ducksql::testing {

/*
  Scripted in-process engine for executor / reader tests.

  A FakeConnection answers every command with the same result set and
  records what it was asked to do.
*/

struct FakeColumn {
  std::string name;
  std::string type;
};

struct FakeResult {
  std::vector<FakeColumn>             columns;
  std::vector<std::vector<db::Value>> rows;
};

class FakeCursor : public db::Cursor {
 public:
  explicit FakeCursor(FakeResult result) : result_(std::move(result)) {
  }

  int FieldCount() const override {
    return static_cast<int>(result_.columns.size());
  }
  std::string GetName(int ordinal) const override {
    return result_.columns.at(ordinal).name;
  }
  std::string GetDataTypeName(int ordinal) const override {
    return result_.columns.at(ordinal).type;
  }

  bool Read() override {
    if (row_ + 1 >= static_cast<int>(result_.rows.size())) {
      row_ = static_cast<int>(result_.rows.size());
      return false;
    }
    ++row_;
    return true;
  }

  bool IsNull(int ordinal) const override {
    return GetValue(ordinal).IsNull();
  }
  db::Value GetValue(int ordinal) const override {
    if (row_ < 0 || row_ >= static_cast<int>(result_.rows.size())) {
      throw std::logic_error("no current row");
    }
    return result_.rows.at(row_).at(ordinal);
  }

 private:
  FakeResult result_;
  int        row_ = -1;
};

struct FakeState {
  FakeResult result;

  bool open        = false;
  int  open_calls  = 0;
  int  close_calls = 0;

  int interrupts = 0;

  std::vector<std::string>             executed;
  std::vector<db::ParameterCollection> bound;
  int                                  prepares = 0;
  std::vector<db::CommandType>         command_types;

  int commits   = 0;
  int rollbacks = 0;

  // Returned by ExecuteNonQuery.
  std::int64_t affected = 1;
  // Throw from ExecuteNonQuery when the SQL contains this text.
  std::string fail_on;
};

class FakeCommand : public db::Command {
 public:
  FakeCommand(std::shared_ptr<FakeState> state, std::string text) : state_(std::move(state)), text_(std::move(text)) {
  }

  const std::string& Text() const override {
    return text_;
  }
  void SetText(std::string text) override {
    text_ = std::move(text);
  }

  db::CommandType GetCommandType() const override {
    return type_;
  }
  void SetCommandType(db::CommandType type) override {
    type_ = type;
  }

  db::ParameterCollection& Parameters() override {
    return parameters_;
  }

  void Prepare() override {
    ++state_->prepares;
  }

  std::unique_ptr<db::Cursor> ExecuteReader() override {
    Record();
    return std::make_unique<FakeCursor>(state_->result);
  }

  std::int64_t ExecuteNonQuery() override {
    Record();
    if (!state_->fail_on.empty() && text_.find(state_->fail_on) != std::string::npos) {
      throw std::runtime_error("Constraint Error: duplicate key");
    }
    return state_->affected;
  }

 private:
  void Record() {
    if (!state_->open) {
      throw std::logic_error("connection is closed");
    }
    state_->executed.push_back(text_);
    state_->bound.push_back(parameters_);
    state_->command_types.push_back(type_);
  }

  std::shared_ptr<FakeState> state_;
  std::string                text_;
  db::CommandType            type_ = db::CommandType::kText;
  db::ParameterCollection    parameters_;
};

class FakeTransaction : public db::Transaction {
 public:
  explicit FakeTransaction(std::shared_ptr<FakeState> state) : state_(std::move(state)) {
  }

  ~FakeTransaction() override {
    if (!completed_) {
      ++state_->rollbacks;
    }
  }

  void Commit() override {
    ++state_->commits;
    completed_ = true;
  }
  void Rollback() override {
    ++state_->rollbacks;
    completed_ = true;
  }
  bool IsCompleted() const override {
    return completed_;
  }

 private:
  std::shared_ptr<FakeState> state_;
  bool                       completed_ = false;
};

class FakeConnection : public db::Connection {
 public:
  FakeConnection() : state_(std::make_shared<FakeState>()) {
  }

  FakeState& State() {
    return *state_;
  }

  void Open() override {
    state_->open = true;
    ++state_->open_calls;
  }
  void Close() override {
    state_->open = false;
    ++state_->close_calls;
  }
  bool IsOpen() const override {
    return state_->open;
  }

  const std::string& ConnectionString() const override {
    return connection_string_;
  }

  std::unique_ptr<db::Command> CreateCommand(std::string text) override {
    return std::make_unique<FakeCommand>(state_, std::move(text));
  }

  std::unique_ptr<db::Transaction> BeginTransaction() override {
    return std::make_unique<FakeTransaction>(state_);
  }

  void Interrupt() override {
    ++state_->interrupts;
  }

 private:
  std::shared_ptr<FakeState> state_;
  std::string                connection_string_ = "Data Source=:memory:fake";
};

} // namespace ducksql::testing
