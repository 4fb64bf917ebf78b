#pragma once
#include <memory>
#include <sanidate/schema/value.hpp>
#include <string>

namespace sanidate::schema {

/// Per-field execution context handed to constraint factories.
///
/// `original_data` is the snapshot of the whole submitted record taken once
/// per check; every field of that check shares it and none may mutate it.
struct param_context_t final {
  std::string name;
  value_t original_value;
  std::shared_ptr<const record_t> original_data;

  /// Original raw value of another field, `undefined` when absent.
  value_t original(const std::string& field) const {
    if (!original_data) {
      return make_undefined();
    }
    auto found = original_data->find(field);
    if (found == std::end(*original_data)) {
      return make_undefined();
    }
    return found->second;
  }
};

}  // namespace sanidate::schema
