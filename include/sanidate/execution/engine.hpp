#pragma once
#include <functional>
#include <future>
#include <sanidate/execution/registry.hpp>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/sanidation_result.hpp>
#include <sanidate/schema/value.hpp>

namespace sanidate::execution {

struct check_options_t final {
  /// Drop fields that succeed with a null or undefined value.
  bool exclude_empty{false};
};

using result_callback_t =
    std::function<void(schema::sanidation_result_t result)>;

/// Sanidates whole records against a schema.
///
/// Every field's chain is launched independently and the result is built
/// once all of them have reached a terminal state. Fields never see each
/// other's sanidized output; `derive` reads the sibling's original raw value
/// from the snapshot taken before any chain starts.
class engine final {
 public:
  /// Use the process-wide default registry.
  engine();

  /// Use a caller-owned registry; it must outlive the engine.
  explicit engine(const registry& registry);

  /// Sanidate `record` and deliver the result to `done` exactly once.
  ///
  /// All fields are resolved and bound before any of them runs, so an
  /// unknown constraint throws `configuration_error` from this call and no
  /// constraint is evaluated. `done` may run before this call returns (all
  /// constraints synchronous) or later on whichever thread completes the
  /// last field.
  void check(const schema::record_t& record,
             const schema::schema_t& schema,
             const check_options_t& options,
             result_callback_t done) const;

  /// Future-returning form of `check`.
  ///
  /// `configuration_error` is still thrown synchronously.
  std::future<schema::sanidation_result_t> check(
      const schema::record_t& record,
      const schema::schema_t& schema,
      bool exclude_empty = false) const;

  const registry& constraints() const { return registry_; }

 private:
  const registry& registry_;
};

}  // namespace sanidate::execution
