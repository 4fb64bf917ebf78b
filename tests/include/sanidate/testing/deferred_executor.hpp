#pragma once

#include <sanidate/schema/evaluator.hpp>

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace sanidate::testing {

/// Manual task queue standing in for an I/O backend. Asynchronous test
/// constraints park their continuation here until the test releases it.
class deferred_executor final {
 public:
  void post(std::function<void()> task) { tasks_.push_back(std::move(task)); }

  std::size_t pending() const { return tasks_.size(); }

  void run_front() { run_at(0); }

  void run_back() {
    if (tasks_.empty()) {
      throw std::logic_error{"no deferred task to run"};
    }
    run_at(tasks_.size() - 1);
  }

  void run_at(const std::size_t index) {
    if (index >= tasks_.size()) {
      throw std::logic_error{"no deferred task at index"};
    }
    auto task = std::move(tasks_[index]);
    tasks_.erase(std::begin(tasks_) + static_cast<std::ptrdiff_t>(index));
    task();
  }

  /// Drains the queue in posting order, including tasks posted while
  /// draining.
  void run_all() {
    while (!tasks_.empty()) {
      run_front();
    }
  }

 private:
  std::deque<std::function<void()>> tasks_;
};

/// Asynchronous constraint that passes its input through under `name` once
/// released.
inline sanidate::schema::async_evaluator_t make_deferred_pass(
    deferred_executor& executor,
    std::string name) {
  return [&executor, name = std::move(name)](
             const sanidate::schema::value_t& value,
             sanidate::schema::continuation_t next) {
    executor.post([value, name, next = std::move(next)] {
      next(sanidate::schema::make_outcome(value, name));
    });
  };
}

/// Asynchronous constraint that reports a fixed outcome once released.
inline sanidate::schema::async_evaluator_t make_deferred_outcome(
    deferred_executor& executor,
    sanidate::schema::constraint_outcome_t outcome) {
  return [&executor, outcome = std::move(outcome)](
             const sanidate::schema::value_t&,
             sanidate::schema::continuation_t next) {
    executor.post([outcome, next = std::move(next)] { next(outcome); });
  };
}

}  // namespace sanidate::testing
