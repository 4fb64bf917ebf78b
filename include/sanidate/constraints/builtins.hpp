#pragma once
#include <cstddef>
#include <optional>
#include <sanidate/execution/registry.hpp>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/evaluator.hpp>
#include <sanidate/schema/param_context.hpp>
#include <sanidate/schema/value.hpp>
#include <string_view>

// Built-in constraint factories. Each one reports its own name on failure
// and is registered under that name by `register_builtins`.
namespace sanidate::constraints {

// Format checks (format.cpp).

/// Longest string form `match` will search; longer values are invalid.
/// std::regex recurses once per input character.
inline constexpr auto kMaxMatchLength = std::size_t{4096};
/// Longest address `email` accepts (RFC 5321 path limit).
inline constexpr auto kMaxEmailLength = std::size_t{254};

schema::evaluator_t make_required(const schema::arguments_t& arguments,
                                  const schema::param_context_t& context);
schema::evaluator_t make_match(const schema::arguments_t& arguments,
                               const schema::param_context_t& context);
schema::evaluator_t make_email(const schema::arguments_t& arguments,
                               const schema::param_context_t& context);
schema::evaluator_t make_zip(const schema::arguments_t& arguments,
                             const schema::param_context_t& context);
schema::evaluator_t make_phone(const schema::arguments_t& arguments,
                               const schema::param_context_t& context);

// Number parsing and bounds (numeric.cpp).
schema::evaluator_t make_numeric(const schema::arguments_t& arguments,
                                 const schema::param_context_t& context);
schema::evaluator_t make_integer(const schema::arguments_t& arguments,
                                 const schema::param_context_t& context);
schema::evaluator_t make_min(const schema::arguments_t& arguments,
                             const schema::param_context_t& context);
schema::evaluator_t make_max(const schema::arguments_t& arguments,
                             const schema::param_context_t& context);

// Dates (date.cpp).
schema::evaluator_t make_date(const schema::arguments_t& arguments,
                              const schema::param_context_t& context);

// Boolean coercion; never fails (boolean.cpp).
schema::evaluator_t make_is_true(const schema::arguments_t& arguments,
                                 const schema::param_context_t& context);
schema::evaluator_t make_is_not_false(const schema::arguments_t& arguments,
                                      const schema::param_context_t& context);

// Chain control and cross-field rules (flow.cpp).
schema::evaluator_t make_custom(const schema::arguments_t& arguments,
                                const schema::param_context_t& context);
schema::evaluator_t make_optional(const schema::arguments_t& arguments,
                                  const schema::param_context_t& context);
schema::evaluator_t make_derive(const schema::arguments_t& arguments,
                                const schema::param_context_t& context);

// Document existence checks; asynchronous (document.cpp).
schema::evaluator_t make_is_document(const schema::arguments_t& arguments,
                                     const schema::param_context_t& context);
schema::evaluator_t make_is_not_document(
    const schema::arguments_t& arguments,
    const schema::param_context_t& context);

/// Parses an ISO-8601 date or date-time; std::nullopt when malformed.
std::optional<schema::date_t> parse_date(std::string_view text);

/// Register every built-in under its public name.
void register_builtins(execution::registry& registry);

}  // namespace sanidate::constraints
