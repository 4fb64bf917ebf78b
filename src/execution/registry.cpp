#include <spdlog/spdlog.h>
#include <iterator>
#include <sanidate/constraints/builtins.hpp>
#include <sanidate/execution/registry.hpp>

namespace sanidate::execution {

registry::registry(const registry& other) {
  auto lock = std::scoped_lock{other.mutex_};
  factories_ = other.factories_;
}

registry& registry::operator=(const registry& other) {
  if (this != &other) {
    auto lock = std::scoped_lock{mutex_, other.mutex_};
    factories_ = other.factories_;
  }
  return *this;
}

void registry::register_constraint(std::string name, factory_t factory) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = factories_.find(name);
  if (existing != std::end(factories_)) {
    spdlog::warn("Replacing constraint factory '{}'", name);
    existing->second = std::move(factory);
    return;
  }
  spdlog::debug("Registering constraint factory '{}'", name);
  factories_.emplace(std::move(name), std::move(factory));
}

bool registry::unregister_constraint(std::string_view name) {
  auto lock = std::scoped_lock{mutex_};
  auto existing = factories_.find(name);
  if (existing == std::end(factories_)) {
    return false;
  }
  factories_.erase(existing);
  spdlog::debug("Unregistered constraint factory '{}'", name);
  return true;
}

std::optional<factory_t> registry::lookup(std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = factories_.find(name);
  if (found == std::end(factories_)) {
    return std::nullopt;
  }
  return found->second;
}

bool registry::contains(std::string_view name) const {
  auto lock = std::scoped_lock{mutex_};
  return factories_.find(name) != std::end(factories_);
}

std::vector<std::string> registry::names() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<std::string>{};
  out.reserve(factories_.size());
  for (const auto& [name, factory] : factories_) {
    out.push_back(name);
  }
  return out;
}

registry make_default_registry() {
  auto seeded = registry{};
  sanidate::constraints::register_builtins(seeded);
  return seeded;
}

registry& default_registry() {
  static auto instance = make_default_registry();
  return instance;
}

}  // namespace sanidate::execution
