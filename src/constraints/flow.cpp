#include <sanidate/constraints/arguments.hpp>
#include <sanidate/constraints/builtins.hpp>
#include <utility>

namespace sanidate::constraints {

schema::evaluator_t make_custom(const schema::arguments_t& arguments,
                                const schema::param_context_t& context) {
  auto function = detail::require_argument<schema::custom_fn_t>(
      arguments, 0, "custom", context, "a custom evaluator function");
  if (!function) {
    detail::reject_arguments("custom", context, "function is empty");
  }
  return schema::async_evaluator_t{
      [function = std::move(function), context](
          const schema::value_t& value, schema::continuation_t next) {
        function(context, value, std::move(next));
      }};
}

schema::evaluator_t make_optional(const schema::arguments_t& arguments,
                                  const schema::param_context_t& context) {
  auto fallback = schema::default_fn_t{};
  if (const auto* compute =
          detail::argument_if<schema::default_fn_t>(arguments, 0)) {
    fallback = *compute;
  } else if (const auto* literal =
                 detail::argument_if<schema::value_t>(arguments, 0)) {
    fallback = [literal = *literal] { return literal; };
  } else if (!arguments.empty()) {
    detail::reject_arguments("optional", context,
                             "default must be a value or a function");
  } else {
    fallback = [] { return schema::make_undefined(); };
  }

  return schema::sync_evaluator_t{
      [fallback = std::move(fallback)](const schema::value_t& value) {
        if (schema::is_truthy(value)) {
          return schema::make_outcome(value, "optional");
        }
        return schema::make_interrupt(fallback());
      }};
}

schema::evaluator_t make_derive(const schema::arguments_t& arguments,
                                const schema::param_context_t& context) {
  auto sibling =
      detail::string_argument(arguments, 0, "derive", context);
  if (!sibling) {
    detail::reject_arguments("derive", context,
                             "argument 1 must name another field");
  }
  auto rule = detail::require_argument<schema::derive_fn_t>(
      arguments, 1, "derive", context, "a derive function");
  if (!rule) {
    detail::reject_arguments("derive", context, "function is empty");
  }

  // Captured now, before any field runs.
  auto other = context.original(*sibling);
  return schema::sync_evaluator_t{
      [rule = std::move(rule), other = std::move(other)](
          const schema::value_t& value) {
        return schema::make_outcome(rule(value, other), "derive");
      }};
}

}  // namespace sanidate::constraints
