#include <cmath>
#include <cstdint>
#include <sanidate/constraints/arguments.hpp>
#include <sanidate/constraints/builtins.hpp>
#include <string>

namespace sanidate::constraints {

namespace {

enum class bound_t : uint8_t { lower, upper };

/// Shared body of `min` and `max`: parse (as integer or float) and compare
/// against the bound, exclusive unless `equality` is set.
schema::evaluator_t make_bound(const schema::arguments_t& arguments,
                               const schema::param_context_t& context,
                               const bound_t bound,
                               const std::string& name) {
  auto limit = detail::number_argument(arguments, 0, name, context);
  auto integer = detail::flag_argument(arguments, 1, name, context);
  auto equality = detail::flag_argument(arguments, 2, name, context);

  return schema::sync_evaluator_t{[=](const schema::value_t& value) {
    auto text = schema::to_string(value);
    auto parsed = schema::value_t{};
    auto number = double{};
    if (integer) {
      auto maybe = schema::parse_integer_prefix(text);
      if (!maybe) {
        return schema::make_outcome(schema::make_invalid(), name);
      }
      parsed = *maybe;
      number = static_cast<double>(*maybe);
    } else {
      auto maybe = schema::parse_float_prefix(text);
      if (!maybe) {
        return schema::make_outcome(schema::make_invalid(), name);
      }
      parsed = *maybe;
      number = *maybe;
    }

    auto within = false;
    if (bound == bound_t::lower) {
      within = equality ? number >= limit : number > limit;
    } else {
      within = equality ? number <= limit : number < limit;
    }
    return schema::make_outcome(within ? parsed : schema::make_invalid(),
                                name);
  }};
}

}  // namespace

schema::evaluator_t make_numeric(const schema::arguments_t&,
                                 const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    auto parsed = schema::parse_float_prefix(schema::to_string(value));
    if (!parsed || std::isnan(*parsed)) {
      return schema::make_outcome(schema::make_invalid(), "numeric");
    }
    return schema::make_outcome(*parsed, "numeric");
  }};
}

schema::evaluator_t make_integer(const schema::arguments_t&,
                                 const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    auto parsed = schema::parse_integer_prefix(schema::to_string(value));
    if (!parsed) {
      return schema::make_outcome(schema::make_invalid(), "integer");
    }
    return schema::make_outcome(*parsed, "integer");
  }};
}

schema::evaluator_t make_min(const schema::arguments_t& arguments,
                             const schema::param_context_t& context) {
  return make_bound(arguments, context, bound_t::lower, "min");
}

schema::evaluator_t make_max(const schema::arguments_t& arguments,
                             const schema::param_context_t& context) {
  return make_bound(arguments, context, bound_t::upper, "max");
}

}  // namespace sanidate::constraints
