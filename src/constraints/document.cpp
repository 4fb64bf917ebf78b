#include <cstdint>
#include <sanidate/constraints/arguments.hpp>
#include <sanidate/constraints/builtins.hpp>
#include <string>
#include <utility>

namespace sanidate::constraints {

namespace {

enum class expectation_t : uint8_t { present, absent };

schema::evaluator_t make_lookup(const schema::arguments_t& arguments,
                                const schema::param_context_t& context,
                                const expectation_t expectation,
                                const std::string& name) {
  auto lookup = detail::require_argument<schema::document_lookup_t>(
      arguments, 0, name, context, "a document lookup");
  if (!lookup) {
    detail::reject_arguments(name, context, "document lookup is empty");
  }
  auto key = detail::string_argument(arguments, 1, name, context)
                 .value_or(std::string{});
  if (key.empty()) {
    key = context.name;
  }

  return schema::async_evaluator_t{
      [lookup = std::move(lookup), key = std::move(key), expectation, name](
          const schema::value_t& value, schema::continuation_t next) {
        lookup(key, value,
               [value, expectation, name, next = std::move(next)](
                   std::optional<std::string> error,
                   schema::document_ptr_t document) {
                 if (error) {
                   next(schema::make_leaf_error(std::move(*error), name));
                   return;
                 }
                 if (expectation == expectation_t::present) {
                   next(schema::make_outcome(
                       document ? schema::value_t{std::move(document)}
                                : schema::make_invalid(),
                       name));
                   return;
                 }
                 next(schema::make_outcome(
                     document ? schema::make_invalid() : value, name));
               });
      }};
}

}  // namespace

schema::evaluator_t make_is_document(const schema::arguments_t& arguments,
                                     const schema::param_context_t& context) {
  return make_lookup(arguments, context, expectation_t::present, "isDocument");
}

schema::evaluator_t make_is_not_document(
    const schema::arguments_t& arguments,
    const schema::param_context_t& context) {
  return make_lookup(arguments, context, expectation_t::absent,
                     "isNotDocument");
}

}  // namespace sanidate::constraints
