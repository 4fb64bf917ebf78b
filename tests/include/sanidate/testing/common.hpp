#pragma once

#include <sanidate/execution/engine.hpp>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/sanidation_result.hpp>
#include <sanidate/schema/value.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace sanidate::testing {

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Runs a check whose constraints all complete on the calling thread.
/// std::nullopt means the result was not delivered before `check` returned.
inline std::optional<sanidate::schema::sanidation_result_t> run_check(
    const sanidate::execution::engine& engine,
    const sanidate::schema::record_t& record,
    const sanidate::schema::schema_t& schema,
    const sanidate::execution::check_options_t& options = {}) {
  auto delivered = std::optional<sanidate::schema::sanidation_result_t>{};
  engine.check(record, schema, options,
               [&delivered](sanidate::schema::sanidation_result_t result) {
                 delivered = std::move(result);
               });
  return delivered;
}

/// Single-constraint chain without arguments.
inline sanidate::schema::field_schema_t chain(const char* name) {
  return sanidate::schema::field_schema_t{
      sanidate::schema::constraint_spec_t{name}};
}

/// Outcome of running one evaluator that completes synchronously.
inline sanidate::schema::constraint_outcome_t evaluate(
    const sanidate::schema::evaluator_t& evaluator,
    const sanidate::schema::value_t& value) {
  if (const auto* sync =
          std::get_if<sanidate::schema::sync_evaluator_t>(&evaluator)) {
    return (*sync)(value);
  }
  auto outcome = sanidate::schema::constraint_outcome_t{};
  std::get<sanidate::schema::async_evaluator_t>(evaluator)(
      value, [&outcome](sanidate::schema::constraint_outcome_t result) {
        outcome = std::move(result);
      });
  return outcome;
}

}  // namespace sanidate::testing
