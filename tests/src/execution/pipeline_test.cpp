#include <gtest/gtest.h>
#include <sanidate/execution/pipeline.hpp>
#include <sanidate/testing/deferred_executor.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sanidate;

namespace {

execution::bound_constraint_t make_step(
    const std::string& name,
    std::function<schema::constraint_outcome_t(const schema::value_t&)> fn) {
  return execution::bound_constraint_t{
      .name = name, .evaluator = schema::sync_evaluator_t{std::move(fn)}};
}

execution::bound_constraint_t make_pass(const std::string& name,
                                        std::vector<std::string>& calls) {
  return make_step(name, [name, &calls](const schema::value_t& value) {
    calls.push_back(name);
    return schema::make_outcome(value, name);
  });
}

execution::bound_constraint_t make_reject(const std::string& name,
                                          std::vector<std::string>& calls) {
  return make_step(name, [name, &calls](const schema::value_t&) {
    calls.push_back(name);
    return schema::make_outcome(schema::make_invalid(), name);
  });
}

std::optional<execution::field_result_t> run(execution::bound_chain_t chain,
                                             schema::value_t value) {
  auto delivered = std::optional<execution::field_result_t>{};
  execution::run_pipeline("field", std::move(chain), std::move(value),
                          [&delivered](execution::field_result_t result) {
                            EXPECT_FALSE(delivered.has_value());
                            delivered = std::move(result);
                          });
  return delivered;
}

}  // namespace

TEST(pipeline, empty_chain_returns_input_unchanged) {
  auto result = run({}, schema::value_t{"as is"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::succeeded);
  EXPECT_EQ(result->value, schema::value_t{"as is"});
}

TEST(pipeline, each_constraint_receives_previous_output) {
  auto chain = execution::bound_chain_t{
      make_step("double", [](const schema::value_t& value) {
        return schema::make_outcome(value.get<int64_t>() * 2, "double");
      }),
      make_step("increment", [](const schema::value_t& value) {
        return schema::make_outcome(value.get<int64_t>() + 1, "increment");
      })};
  auto result = run(std::move(chain), schema::value_t{5});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->value, schema::value_t{11});
}

TEST(pipeline, first_invalid_value_stops_the_chain) {
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{make_pass("first", calls),
                                        make_reject("second", calls),
                                        make_pass("third", calls)};
  auto result = run(std::move(chain), schema::value_t{"x"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::failed);
  EXPECT_EQ(result->constraint_name, "second");
  EXPECT_TRUE(schema::is_invalid(result->value));
  EXPECT_EQ(calls, (std::vector<std::string>{"first", "second"}));
}

TEST(pipeline, leaf_error_fails_with_reported_name_and_message) {
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{
      make_step("lookup",
                [](const schema::value_t&) {
                  return schema::make_leaf_error("store offline", "lookup");
                }),
      make_pass("after", calls)};
  auto result = run(std::move(chain), schema::value_t{"x"});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::failed);
  EXPECT_EQ(result->constraint_name, "lookup");
  EXPECT_EQ(result->error, "store offline");
  EXPECT_TRUE(calls.empty());
}

TEST(pipeline, interrupt_accepts_value_and_skips_the_rest) {
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{
      make_step("fallback",
                [](const schema::value_t&) {
                  return schema::make_interrupt(schema::make_invalid());
                }),
      make_reject("never", calls)};
  auto result = run(std::move(chain), schema::value_t{});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::succeeded);
  EXPECT_TRUE(schema::is_invalid(result->value));
  EXPECT_TRUE(calls.empty());
}

TEST(pipeline, thrown_exception_becomes_leaf_error) {
  auto chain = execution::bound_chain_t{
      make_step("explode", [](const schema::value_t&)
                               -> schema::constraint_outcome_t {
        throw std::runtime_error{"boom"};
      })};
  auto result = run(std::move(chain), schema::value_t{1});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::failed);
  EXPECT_EQ(result->constraint_name, "explode");
  EXPECT_EQ(result->error, "boom");
}

TEST(pipeline, asynchronous_step_resumes_when_released) {
  auto executor = sanidate::testing::deferred_executor{};
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{
      execution::bound_constraint_t{
          .name = "remote",
          .evaluator = sanidate::testing::make_deferred_pass(executor, "remote")},
      make_pass("local", calls)};

  auto delivered = std::optional<execution::field_result_t>{};
  execution::run_pipeline("field", std::move(chain), schema::value_t{"v"},
                          [&delivered](execution::field_result_t result) {
                            delivered = std::move(result);
                          });
  EXPECT_FALSE(delivered.has_value());
  EXPECT_TRUE(calls.empty());
  ASSERT_EQ(executor.pending(), 1u);

  executor.run_all();
  ASSERT_TRUE(delivered.has_value());
  EXPECT_EQ(delivered->status, schema::field_status_t::succeeded);
  EXPECT_EQ(delivered->value, schema::value_t{"v"});
  EXPECT_EQ(calls, (std::vector<std::string>{"local"}));
}

TEST(pipeline, duplicate_continuation_delivers_first_outcome_only) {
  auto stored = schema::continuation_t{};
  auto chain = execution::bound_chain_t{execution::bound_constraint_t{
      .name = "twice",
      .evaluator = schema::async_evaluator_t{
          [&stored](const schema::value_t&, schema::continuation_t next) {
            stored = std::move(next);
          }}}};

  auto deliveries = std::vector<execution::field_result_t>{};
  execution::run_pipeline("field", std::move(chain), schema::value_t{"v"},
                          [&deliveries](execution::field_result_t result) {
                            deliveries.push_back(std::move(result));
                          });
  ASSERT_TRUE(static_cast<bool>(stored));
  stored(schema::make_outcome(schema::value_t{"first"}, "twice"));
  stored(schema::make_outcome(schema::make_invalid(), "twice"));

  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries.front().status, schema::field_status_t::succeeded);
  EXPECT_EQ(deliveries.front().value, schema::value_t{"first"});
}

TEST(pipeline, asynchronous_throw_before_completion_becomes_leaf_error) {
  auto chain = execution::bound_chain_t{execution::bound_constraint_t{
      .name = "remote",
      .evaluator = schema::async_evaluator_t{
          [](const schema::value_t&, schema::continuation_t) {
            throw std::runtime_error{"unreachable"};
          }}}};
  auto result = run(std::move(chain), schema::value_t{3});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->status, schema::field_status_t::failed);
  EXPECT_EQ(result->constraint_name, "remote");
  EXPECT_EQ(result->error, "unreachable");
}

TEST(pipeline, asynchronous_throw_after_completion_propagates) {
  auto chain = execution::bound_chain_t{execution::bound_constraint_t{
      .name = "eager",
      .evaluator = schema::async_evaluator_t{
          [](const schema::value_t& value, schema::continuation_t next) {
            next(schema::make_outcome(value, "eager"));
            throw std::runtime_error{"late failure"};
          }}}};

  auto deliveries = std::vector<execution::field_result_t>{};
  EXPECT_THROW(
      execution::run_pipeline("field", std::move(chain), schema::value_t{3},
                              [&deliveries](execution::field_result_t result) {
                                deliveries.push_back(std::move(result));
                              }),
      std::runtime_error);
  ASSERT_EQ(deliveries.size(), 1u);
  EXPECT_EQ(deliveries.front().status, schema::field_status_t::succeeded);
  EXPECT_EQ(deliveries.front().value, schema::value_t{3});
}

TEST(pipeline, callback_exception_after_inline_completion_reaches_caller) {
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{
      execution::bound_constraint_t{
          .name = "inline",
          .evaluator = schema::async_evaluator_t{
              [](const schema::value_t& value, schema::continuation_t next) {
                next(schema::make_outcome(value, "inline"));
              }}},
      make_pass("local", calls)};

  auto deliveries = 0;
  EXPECT_THROW(
      execution::run_pipeline("field", std::move(chain), schema::value_t{"v"},
                              [&deliveries](execution::field_result_t) {
                                ++deliveries;
                                throw std::logic_error{"callback failed"};
                              }),
      std::logic_error);
  EXPECT_EQ(deliveries, 1);
  EXPECT_EQ(calls, (std::vector<std::string>{"local"}));
}

TEST(pipeline, callback_exception_after_synchronous_chain_reaches_caller) {
  auto calls = std::vector<std::string>{};
  auto chain = execution::bound_chain_t{make_pass("local", calls)};
  EXPECT_THROW(
      execution::run_pipeline("field", std::move(chain), schema::value_t{"v"},
                              [](execution::field_result_t) {
                                throw std::logic_error{"callback failed"};
                              }),
      std::logic_error);
  EXPECT_EQ(calls, (std::vector<std::string>{"local"}));
}
