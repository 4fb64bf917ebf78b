#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/evaluator.hpp>
#include <sanidate/schema/param_context.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace sanidate::execution {

/// Builds a bound evaluator from declared arguments and the field context.
///
/// May throw `configuration_error` when the arguments are unusable.
using factory_t = std::function<schema::evaluator_t(
    const schema::arguments_t& arguments,
    const schema::param_context_t& context)>;

/// Name -> constraint factory mapping consulted on every check.
///
/// Lookups are not cached by callers, so edits apply to the next check.
/// Callers must not edit a registry that an in-flight check depends on.
class registry final {
 public:
  registry() = default;
  registry(const registry& other);
  registry& operator=(const registry& other);

  /// Add a factory, replacing any previous one under the same name.
  void register_constraint(std::string name, factory_t factory);

  /// Remove a factory; returns false when the name was not registered.
  bool unregister_constraint(std::string_view name);

  std::optional<factory_t> lookup(std::string_view name) const;
  bool contains(std::string_view name) const;
  std::vector<std::string> names() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, factory_t, std::less<>> factories_;
};

/// A new registry seeded with every built-in constraint.
registry make_default_registry();

/// Process-wide registry seeded with built-ins on first use.
registry& default_registry();

}  // namespace sanidate::execution
