#pragma once

#include <memory>
#include <string>

#include "internal/db/api/command.hpp"
#include "internal/db/api/transaction.hpp"

namespace ducksql::db {

class Connection {
 public:
  virtual ~Connection() = default;

  virtual void Open()         = 0;
  virtual void Close()        = 0;
  virtual bool IsOpen() const = 0;

  virtual const std::string& ConnectionString() const = 0;

  virtual std::unique_ptr<Command>     CreateCommand(std::string text) = 0;
  virtual std::unique_ptr<Transaction> BeginTransaction()              = 0;

  // Asks the engine to abort whatever is running on this connection.
  // Safe to call from another thread.
  virtual void Interrupt() = 0;
};

} // namespace ducksql::db
