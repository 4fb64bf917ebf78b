#include <sanidate/constraints/builtins.hpp>

namespace sanidate::constraints {

void register_builtins(execution::registry& registry) {
  registry.register_constraint("required", make_required);
  registry.register_constraint("match", make_match);
  registry.register_constraint("numeric", make_numeric);
  registry.register_constraint("integer", make_integer);
  registry.register_constraint("min", make_min);
  registry.register_constraint("max", make_max);
  registry.register_constraint("date", make_date);
  registry.register_constraint("email", make_email);
  registry.register_constraint("zip", make_zip);
  registry.register_constraint("phone", make_phone);
  registry.register_constraint("isTrue", make_is_true);
  registry.register_constraint("isNotFalse", make_is_not_false);
  registry.register_constraint("isDocument", make_is_document);
  registry.register_constraint("isNotDocument", make_is_not_document);
  registry.register_constraint("custom", make_custom);
  registry.register_constraint("optional", make_optional);
  registry.register_constraint("derive", make_derive);
}

}  // namespace sanidate::constraints
