#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>
#include <sanidate/execution/engine.hpp>
#include <sanidate/execution/normalizer.hpp>
#include <sanidate/execution/pipeline.hpp>
#include <utility>
#include <vector>

namespace sanidate::execution {

namespace {

/// Join point shared by every field pipeline of one check.
struct join_state final {
  std::mutex mutex;
  std::size_t remaining{};
  check_options_t options;
  schema::record_t cleaned;
  schema::error_report_t report;
  result_callback_t done;
};

struct launch_t final {
  std::string field;
  bound_chain_t chain;
  schema::value_t value;
};

void record_field(join_state& join,
                  const std::string& field,
                  field_result_t result) {
  if (result.status == schema::field_status_t::failed) {
    join.report.count += 1;
    join.report.errors[field] = result.constraint_name;
    if (result.error) {
      join.report.leaf_errors[field] = std::move(*result.error);
    }
    return;
  }
  if (join.options.exclude_empty && schema::is_empty(result.value)) {
    return;
  }
  join.cleaned[field] = std::move(result.value);
}

schema::sanidation_result_t take_result(join_state& join) {
  auto result = schema::sanidation_result_t{};
  result.cleaned = std::move(join.cleaned);
  if (join.report.count > 0) {
    result.errors = std::move(join.report);
  }
  return result;
}

}  // namespace

engine::engine() : registry_{default_registry()} {}

engine::engine(const registry& registry) : registry_{registry} {}

void engine::check(const schema::record_t& record,
                   const schema::schema_t& schema,
                   const check_options_t& options,
                   result_callback_t done) const {
  if (schema.empty()) {
    spdlog::warn("Sanidating against an empty schema");
    done(schema::sanidation_result_t{});
    return;
  }

  auto snapshot = std::make_shared<const schema::record_t>(record);

  // Bind every field before launching any, so a configuration error aborts
  // the check with no constraint evaluated.
  auto launches = std::vector<launch_t>{};
  launches.reserve(schema.size());
  for (const auto& [field, constraints] : schema) {
    auto context = schema::param_context_t{.name = field,
                                           .original_value =
                                               snapshot->contains(field)
                                                   ? snapshot->at(field)
                                                   : schema::make_undefined(),
                                           .original_data = snapshot};
    auto chain = normalize_field(registry_, constraints, context);
    launches.push_back(launch_t{.field = field,
                                .chain = std::move(chain),
                                .value = std::move(context.original_value)});
  }

  auto join = std::make_shared<join_state>();
  join->remaining = launches.size();
  join->options = options;
  join->done = std::move(done);

  spdlog::debug("Launching {} field pipeline(s)", launches.size());
  for (auto& launch : launches) {
    auto field = launch.field;
    run_pipeline(
        std::move(launch.field), std::move(launch.chain),
        std::move(launch.value),
        [join, field = std::move(field)](field_result_t result) {
          auto lock = std::unique_lock{join->mutex};
          record_field(*join, field, std::move(result));
          join->remaining -= 1;
          if (join->remaining > 0) {
            return;
          }
          auto finished = take_result(*join);
          auto deliver = std::move(join->done);
          lock.unlock();

          spdlog::info("Sanidated record: {} field(s) cleaned, {} error(s)",
                       finished.cleaned.size(),
                       finished.errors ? finished.errors->count : 0u);
          deliver(std::move(finished));
        });
  }
}

std::future<schema::sanidation_result_t> engine::check(
    const schema::record_t& record,
    const schema::schema_t& schema,
    const bool exclude_empty) const {
  auto promise = std::make_shared<std::promise<schema::sanidation_result_t>>();
  auto future = promise->get_future();
  check(record, schema, check_options_t{.exclude_empty = exclude_empty},
        [promise](schema::sanidation_result_t result) {
          promise->set_value(std::move(result));
        });
  return future;
}

}  // namespace sanidate::execution
