#include <spdlog/spdlog.h>
#include <atomic>
#include <exception>
#include <memory>
#include <sanidate/execution/pipeline.hpp>
#include <utility>

namespace sanidate::execution {

namespace {

struct pipeline_state final {
  std::string field;
  bound_chain_t chain;
  pipeline_callback_t done;
};

using state_ptr_t = std::shared_ptr<pipeline_state>;

/// Shared by every copy of one continuation; only the first call counts.
class continuation_guard final {
 public:
  continuation_guard(std::string field, std::string constraint)
      : field_{std::move(field)}, constraint_{std::move(constraint)} {}

  continuation_guard(const continuation_guard&) = delete;
  continuation_guard& operator=(const continuation_guard&) = delete;

  ~continuation_guard() {
    if (!fired_.load()) {
      spdlog::error(
          "Constraint '{}' of field '{}' dropped its continuation; the field "
          "will never complete",
          constraint_, field_);
    }
  }

  bool try_fire() { return !fired_.exchange(true); }

  const std::string& field() const { return field_; }
  const std::string& constraint() const { return constraint_; }

 private:
  std::atomic<bool> fired_{false};
  std::string field_;
  std::string constraint_;
};

std::optional<field_result_t> settle(schema::constraint_outcome_t& outcome,
                                     const std::string& bound_name,
                                     const bool last) {
  if (outcome.error) {
    return field_result_t{
        .status = schema::field_status_t::failed,
        .value = schema::make_invalid(),
        .constraint_name = outcome.constraint_name.value_or(bound_name),
        .error = std::move(outcome.error)};
  }
  if (!outcome.constraint_name) {
    return field_result_t{.status = schema::field_status_t::succeeded,
                          .value = std::move(outcome.value),
                          .constraint_name = {},
                          .error = std::nullopt};
  }
  if (schema::is_invalid(outcome.value)) {
    return field_result_t{.status = schema::field_status_t::failed,
                          .value = schema::make_invalid(),
                          .constraint_name = *outcome.constraint_name,
                          .error = std::nullopt};
  }
  if (last) {
    return field_result_t{.status = schema::field_status_t::succeeded,
                          .value = std::move(outcome.value),
                          .constraint_name = {},
                          .error = std::nullopt};
  }
  return std::nullopt;
}

void finish(const state_ptr_t& state, field_result_t result) {
  if (result.status == schema::field_status_t::failed) {
    spdlog::debug("Field '{}' {} at constraint '{}'", state->field,
                  schema::to_string(result.status), result.constraint_name);
  } else {
    spdlog::debug("Field '{}' {} with {} value", state->field,
                  schema::to_string(result.status),
                  schema::type_name(result.value));
  }
  state->done(std::move(result));
}

void advance(state_ptr_t state, std::size_t index, schema::value_t value);

void resume(state_ptr_t state,
            const std::size_t index,
            schema::constraint_outcome_t outcome) {
  const auto& bound_name = state->chain[index].name;
  auto terminal =
      settle(outcome, bound_name, (index + 1) == state->chain.size());
  if (terminal) {
    finish(state, std::move(*terminal));
    return;
  }
  advance(std::move(state), index + 1, std::move(outcome.value));
}

void advance(state_ptr_t state, std::size_t index, schema::value_t value) {
  while (true) {
    const auto& constraint = state->chain[index];

    if (const auto* evaluate =
            std::get_if<schema::sync_evaluator_t>(&constraint.evaluator)) {
      auto outcome = schema::constraint_outcome_t{};
      try {
        outcome = (*evaluate)(value);
      } catch (const std::exception& ex) {
        spdlog::error("Constraint '{}' of field '{}' threw: {}",
                      constraint.name, state->field, ex.what());
        outcome = schema::make_leaf_error(ex.what(), constraint.name);
      }
      auto terminal = settle(outcome, constraint.name,
                             (index + 1) == state->chain.size());
      if (terminal) {
        finish(state, std::move(*terminal));
        return;
      }
      value = std::move(outcome.value);
      ++index;
      continue;
    }

    const auto& evaluate =
        std::get<schema::async_evaluator_t>(constraint.evaluator);
    auto guard =
        std::make_shared<continuation_guard>(state->field, constraint.name);
    auto next = schema::continuation_t{
        [state, index, guard](schema::constraint_outcome_t outcome) {
          if (!guard->try_fire()) {
            spdlog::error(
                "Constraint '{}' of field '{}' completed more than once; "
                "ignoring the extra outcome",
                guard->constraint(), guard->field());
            return;
          }
          resume(state, index, std::move(outcome));
        }};

    try {
      evaluate(value, std::move(next));
    } catch (const std::exception& ex) {
      // Once the continuation fired, the rest of the chain and the caller's
      // callback ran inline; their exceptions belong to the caller.
      if (!guard->try_fire()) {
        throw;
      }
      spdlog::error("Constraint '{}' of field '{}' threw: {}", constraint.name,
                    state->field, ex.what());
      resume(state, index, schema::make_leaf_error(ex.what(), constraint.name));
    }
    return;
  }
}

}  // namespace

void run_pipeline(std::string field,
                  bound_chain_t chain,
                  schema::value_t value,
                  pipeline_callback_t done) {
  if (chain.empty()) {
    done(field_result_t{.status = schema::field_status_t::succeeded,
                        .value = std::move(value),
                        .constraint_name = {},
                        .error = std::nullopt});
    return;
  }
  auto state = std::make_shared<pipeline_state>(pipeline_state{
      .field = std::move(field),
      .chain = std::move(chain),
      .done = std::move(done)});
  advance(std::move(state), 0, std::move(value));
}

}  // namespace sanidate::execution
