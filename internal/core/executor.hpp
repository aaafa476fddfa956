#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/core/session.hpp"
#include "internal/core/sql_props.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/errors.hpp"

namespace ducksql::sql {

/*
  Execution modes.

  Every mode runs the same sequence: validate, lease a connection, create +
  bind (+ compile) the command, execute, release. Owned connections are
  closed on every exit path; borrowed ones never are.

  The *Async variants run on their own thread and honour
  props.CancellationToken(); the sync variants ignore it.
*/

using TransactionBatch = core::TransactionBatch;

template <typename F>
using RowResult = std::invoke_result_t<F&, RowReader&>;

// ------------------------------------------------------------
// Synchronous
// ------------------------------------------------------------

template <typename F, typename R = RowResult<F>>
std::vector<R> Execute(const SqlProps& props, F read) {
  core::ReaderSession session(props, std::stop_token{});
  std::vector<R>      rows;
  while (session.Next()) {
    rows.push_back(read(session.Reader()));
  }
  return rows;
}

// Maps the first row; throws util::NoResults when there is none.
template <typename F, typename R = RowResult<F>>
R ExecuteRow(const SqlProps& props, F read) {
  core::ReaderSession session(props, std::stop_token{});
  if (!session.Next()) {
    throw util::NoResults();
  }
  return read(session.Reader());
}

template <typename F>
void Iter(const SqlProps& props, F action) {
  core::ReaderSession session(props, std::stop_token{});
  while (session.Next()) {
    action(session.Reader());
  }
}

std::int64_t ExecuteNonQuery(const SqlProps& props);

// One transaction over all entries, in order. An entry with no parameter
// sets runs once; otherwise once per set, with counts summed per entry.
std::vector<std::int64_t> ExecuteTransaction(const SqlProps& props, const TransactionBatch& batch);

/*
  Restartable lazy result.

  Nothing runs until begin(). Every begin() executes the query again on a
  fresh connection and cursor; the traversal is released when it reaches
  the end or its last iterator is destroyed.
*/
template <typename T>
class LazyRows {
 public:
  using Reader = std::function<T(RowReader&)>;

  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    iterator() = default;

    const T& operator*() const { return *state_->current; }
    const T* operator->() const { return &*state_->current; }

    iterator& operator++() {
      Advance();
      return *this;
    }
    void operator++(int) { Advance(); }

    bool operator==(const iterator& other) const { return state_ == other.state_; }

   private:
    friend class LazyRows;

    struct State {
      State(const SqlProps& props, Reader r) : session(props, std::stop_token{}), read(std::move(r)) {}

      core::ReaderSession session;
      Reader              read;
      std::optional<T>    current;
    };

    iterator(const SqlProps& props, const Reader& read) : state_(std::make_shared<State>(props, read)) {
      Advance();
    }

    void Advance() {
      if (state_->session.Next()) {
        state_->current.emplace(state_->read(state_->session.Reader()));
      } else {
        state_.reset();
      }
    }

    std::shared_ptr<State> state_;
  };

  LazyRows(SqlProps props, Reader read) : props_(std::move(props)), read_(std::move(read)) {}

  iterator begin() const { return iterator(props_, read_); }
  iterator end() const { return iterator(); }

 private:
  SqlProps props_;
  Reader   read_;
};

template <typename F, typename R = RowResult<F>>
LazyRows<R> ToSeq(const SqlProps& props, F read) {
  return LazyRows<R>(props, std::move(read));
}

// ------------------------------------------------------------
// Asynchronous
// ------------------------------------------------------------

template <typename F, typename R = RowResult<F>>
std::future<std::vector<R>> ExecuteAsync(SqlProps props, F read) {
  return std::async(std::launch::async, [props = std::move(props), read = std::move(read)]() mutable {
    core::ReaderSession session(props, props.Cancellation());
    std::vector<R>      rows;
    while (session.Next()) {
      rows.push_back(read(session.Reader()));
    }
    return rows;
  });
}

template <typename F, typename R = RowResult<F>>
std::future<R> ExecuteRowAsync(SqlProps props, F read) {
  return std::async(std::launch::async, [props = std::move(props), read = std::move(read)]() mutable -> R {
    core::ReaderSession session(props, props.Cancellation());
    if (!session.Next()) {
      throw util::NoResults();
    }
    return read(session.Reader());
  });
}

template <typename F>
std::future<void> IterAsync(SqlProps props, F action) {
  return std::async(std::launch::async, [props = std::move(props), action = std::move(action)]() mutable {
    core::ReaderSession session(props, props.Cancellation());
    while (session.Next()) {
      action(session.Reader());
    }
  });
}

std::future<std::int64_t> ExecuteNonQueryAsync(SqlProps props);

std::future<std::vector<std::int64_t>> ExecuteTransactionAsync(SqlProps props, TransactionBatch batch);

/*
  Asynchronous restartable result.

    auto rows = sql::ToSeqAsync(props, read);
    auto it   = rows.Enumerate();
    while (it.MoveNextAsync().get()) use(it.Current());

  Each Enumerate() is an independent traversal with its own connection and
  cursor. Await one MoveNextAsync() before issuing the next.
*/
template <typename T>
class AsyncRows {
 public:
  using Reader = std::function<T(RowReader&)>;

  class Enumerator {
   public:
    std::future<bool> MoveNextAsync() {
      return std::async(std::launch::async, [state = state_]() {
        try {
          if (!state->session) {
            state->session = std::make_unique<core::ReaderSession>(state->props, state->props.Cancellation());
          }
          if (!state->session->Next()) {
            state->session.reset();
            state->current.reset();
            return false;
          }
          state->current.emplace(state->read(state->session->Reader()));
          return true;
        } catch (const std::exception&) {
          state->session.reset();
          throw;
        }
      });
    }

    // Valid after MoveNextAsync() yielded true.
    const T& Current() const { return *state_->current; }

   private:
    friend class AsyncRows;

    struct State {
      SqlProps                             props;
      Reader                               read;
      std::unique_ptr<core::ReaderSession> session;
      std::optional<T>                     current;
    };

    explicit Enumerator(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
  };

  AsyncRows(SqlProps props, Reader read) : props_(std::move(props)), read_(std::move(read)) {}

  Enumerator Enumerate() const {
    using State = typename Enumerator::State;
    return Enumerator(std::make_shared<State>(State{props_, read_, nullptr, std::nullopt}));
  }

 private:
  SqlProps props_;
  Reader   read_;
};

template <typename F, typename R = RowResult<F>>
AsyncRows<R> ToSeqAsync(SqlProps props, F read) {
  return AsyncRows<R>(std::move(props), std::move(read));
}

} // namespace ducksql::sql
