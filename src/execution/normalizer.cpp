#include <spdlog/spdlog.h>
#include <sanidate/execution/configuration_error.hpp>
#include <sanidate/execution/normalizer.hpp>

namespace sanidate::execution {

bound_chain_t normalize_field(const registry& registry,
                              const schema::field_schema_t& constraints,
                              const schema::param_context_t& context) {
  auto chain = bound_chain_t{};
  chain.reserve(constraints.size());
  for (const auto& spec : constraints) {
    auto factory = registry.lookup(spec.name);
    if (!factory) {
      spdlog::error("Constraint '{}' is not registered (field '{}')",
                    spec.name, context.name);
      throw configuration_error{
          context.name, spec.name,
          "constraint '" + spec.name + "' is not registered for field '" +
              context.name + "'"};
    }
    if (!*factory) {
      spdlog::error("Constraint '{}' has an empty factory (field '{}')",
                    spec.name, context.name);
      throw configuration_error{
          context.name, spec.name,
          "constraint '" + spec.name + "' has no factory"};
    }
    chain.push_back(bound_constraint_t{
        .name = spec.name, .evaluator = (*factory)(spec.arguments, context)});
  }
  return chain;
}

}  // namespace sanidate::execution
