#pragma once
#include <cstddef>
#include <optional>
#include <sanidate/execution/configuration_error.hpp>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/param_context.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace sanidate::constraints::detail {

[[noreturn]] inline void reject_arguments(
    const std::string_view constraint,
    const schema::param_context_t& context,
    const std::string& reason) {
  throw execution::configuration_error{
      context.name, std::string{constraint},
      "constraint '" + std::string{constraint} + "' for field '" +
          context.name + "': " + reason};
}

/// Argument at `index` when present and of type T.
template <typename T>
const T* argument_if(const schema::arguments_t& arguments,
                     const std::size_t index) {
  if (index >= arguments.size()) {
    return nullptr;
  }
  return std::get_if<T>(&arguments[index]);
}

/// Argument at `index`; rejects the schema when it is missing or mistyped.
template <typename T>
const T& require_argument(const schema::arguments_t& arguments,
                          const std::size_t index,
                          const std::string_view constraint,
                          const schema::param_context_t& context,
                          const std::string_view expected) {
  const auto* found = argument_if<T>(arguments, index);
  if (found == nullptr) {
    reject_arguments(constraint, context,
                     "argument " + std::to_string(index + 1) +
                         " must be " + std::string{expected});
  }
  return *found;
}

/// Optional boolean flag; any literal is read by truthiness.
inline bool flag_argument(const schema::arguments_t& arguments,
                          const std::size_t index,
                          const std::string_view constraint,
                          const schema::param_context_t& context) {
  if (index >= arguments.size()) {
    return false;
  }
  const auto* literal = argument_if<schema::value_t>(arguments, index);
  if (literal == nullptr) {
    reject_arguments(constraint, context,
                     "argument " + std::to_string(index + 1) +
                         " must be a flag");
  }
  return schema::is_truthy(*literal);
}

/// Numeric literal argument.
inline double number_argument(const schema::arguments_t& arguments,
                              const std::size_t index,
                              const std::string_view constraint,
                              const schema::param_context_t& context) {
  const auto& literal = require_argument<schema::value_t>(
      arguments, index, constraint, context, "a number");
  if (const auto* integer = literal.get_if<int64_t>()) {
    return static_cast<double>(*integer);
  }
  if (const auto* number = literal.get_if<double>()) {
    return *number;
  }
  reject_arguments(constraint, context,
                   "argument " + std::to_string(index + 1) +
                       " must be a number");
}

/// Optional string literal argument.
inline std::optional<std::string> string_argument(
    const schema::arguments_t& arguments,
    const std::size_t index,
    const std::string_view constraint,
    const schema::param_context_t& context) {
  if (index >= arguments.size()) {
    return std::nullopt;
  }
  const auto* literal = argument_if<schema::value_t>(arguments, index);
  if (literal != nullptr && schema::is_undefined(*literal)) {
    return std::nullopt;
  }
  if (literal == nullptr || !literal->is<std::string>()) {
    reject_arguments(constraint, context,
                     "argument " + std::to_string(index + 1) +
                         " must be a string");
  }
  return literal->get<std::string>();
}

}  // namespace sanidate::constraints::detail
