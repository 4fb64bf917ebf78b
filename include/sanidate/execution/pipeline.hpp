#pragma once
#include <functional>
#include <optional>
#include <sanidate/execution/normalizer.hpp>
#include <sanidate/schema/field_status.hpp>
#include <sanidate/schema/value.hpp>
#include <string>

namespace sanidate::execution {

/// Terminal outcome of one field's chain.
struct field_result_t final {
  schema::field_status_t status{schema::field_status_t::succeeded};
  schema::value_t value;
  /// Constraint that failed the field; empty on success.
  std::string constraint_name;
  /// Leaf error message when the failure was an explicit error.
  std::optional<std::string> error;
};

using pipeline_callback_t = std::function<void(field_result_t result)>;

/// Run a bound chain against a field's raw value.
///
/// Constraints run strictly in order, each receiving the previous output.
/// The chain stops at the first error, at the first invalid value, or at an
/// interrupt (which accepts its value unconditionally). An empty chain
/// succeeds with `value` unchanged. `done` is invoked exactly once, possibly
/// before this function returns, possibly later from the thread that
/// completes an asynchronous constraint.
///
/// An exception from a constraint before it completes fails the field with a
/// leaf error. Exceptions thrown after completion, including from `done`,
/// propagate to whoever invoked the step.
///
/// `field` is only used for log lines.
void run_pipeline(std::string field,
                  bound_chain_t chain,
                  schema::value_t value,
                  pipeline_callback_t done);

}  // namespace sanidate::execution
