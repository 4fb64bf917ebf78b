#pragma once
#include <functional>
#include <optional>
#include <sanidate/schema/param_context.hpp>
#include <sanidate/schema/value.hpp>
#include <string>
#include <variant>
#include <vector>

namespace sanidate::schema {

/// What a constraint reports for one value.
///
/// `error` carries an explicit leaf error (for example a failed lookup).
/// An absent `constraint_name` interrupts the chain and accepts `value`
/// unconditionally.
struct constraint_outcome_t final {
  std::optional<std::string> error;
  value_t value;
  std::optional<std::string> constraint_name;
};

inline constraint_outcome_t make_outcome(value_t value,
                                         std::string constraint_name) {
  return constraint_outcome_t{.error = std::nullopt,
                              .value = std::move(value),
                              .constraint_name = std::move(constraint_name)};
}

inline constraint_outcome_t make_interrupt(value_t value) {
  return constraint_outcome_t{.error = std::nullopt,
                              .value = std::move(value),
                              .constraint_name = std::nullopt};
}

inline constraint_outcome_t make_leaf_error(std::string message,
                                            std::string constraint_name) {
  return constraint_outcome_t{.error = std::move(message),
                              .value = make_invalid(),
                              .constraint_name = std::move(constraint_name)};
}

/// Must be invoked exactly once per evaluation, from any thread.
using continuation_t = std::function<void(constraint_outcome_t outcome)>;

/// CPU-only constraint: returns its outcome directly.
using sync_evaluator_t =
    std::function<constraint_outcome_t(const value_t& value)>;

/// Constraint that may suspend; reports through the continuation.
using async_evaluator_t =
    std::function<void(const value_t& value, continuation_t next)>;

using evaluator_t = std::variant<sync_evaluator_t, async_evaluator_t>;

/// Caller-supplied function wrapped by the `custom` constraint.
using custom_fn_t = std::function<void(const param_context_t& context,
                                       const value_t& value,
                                       continuation_t next)>;

/// Rule used by `derive`: current value plus the sibling's original value.
/// Return the invalid marker to fail.
using derive_fn_t =
    std::function<value_t(const value_t& value, const value_t& other)>;

/// Lazily computed default for `optional`.
using default_fn_t = std::function<value_t()>;

/// Answer of a document lookup: an error message, or the document found
/// (null when there is none).
using lookup_callback_t = std::function<void(std::optional<std::string> error,
                                             document_ptr_t document)>;

/// Existence check behind `isDocument` / `isNotDocument`: find a document
/// whose `key` field equals the string form of `value`.
using document_lookup_t = std::function<void(const std::string& key,
                                             const value_t& value,
                                             lookup_callback_t done)>;

}  // namespace sanidate::schema
