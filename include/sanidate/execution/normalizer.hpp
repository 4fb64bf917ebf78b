#pragma once
#include <sanidate/execution/registry.hpp>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/evaluator.hpp>
#include <sanidate/schema/param_context.hpp>
#include <string>
#include <vector>

namespace sanidate::execution {

/// Evaluator bound to one field, with the name it reports under.
struct bound_constraint_t final {
  std::string name;
  schema::evaluator_t evaluator;
};

using bound_chain_t = std::vector<bound_constraint_t>;

/// Resolve and bind every constraint of one field, in declared order.
///
/// Throws `configuration_error` for an unknown constraint name or for
/// arguments the factory rejects. Nothing is evaluated here.
bound_chain_t normalize_field(const registry& registry,
                              const schema::field_schema_t& constraints,
                              const schema::param_context_t& context);

}  // namespace sanidate::execution
