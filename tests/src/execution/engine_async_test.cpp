#include <gtest/gtest.h>
#include <sanidate/execution/engine.hpp>
#include <sanidate/testing/common.hpp>
#include <sanidate/testing/deferred_executor.hpp>

#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace sanidate;

namespace {

/// `custom` argument parking each evaluation on the executor; the value
/// passes when it is not "bad".
schema::custom_fn_t make_deferred_custom(sanidate::testing::deferred_executor& executor) {
  return [&executor](const schema::param_context_t&,
                     const schema::value_t& value,
                     schema::continuation_t next) {
    executor.post([value, next = std::move(next)] {
      next(schema::make_outcome(
          value == schema::value_t{"bad"} ? schema::make_invalid() : value,
          "custom"));
    });
  };
}

schema::schema_t make_deferred_schema(sanidate::testing::deferred_executor& executor,
                                      const std::vector<std::string>& fields) {
  auto schema = schema::schema_t{};
  for (const auto& field : fields) {
    schema[field] = schema::field_schema_t{
        schema::make_constraint("custom", make_deferred_custom(executor))};
  }
  return schema;
}

}  // namespace

TEST(engine_async, result_waits_for_every_field) {
  auto executor = sanidate::testing::deferred_executor{};
  auto engine = execution::engine{};
  auto record = schema::record_t{{"a", schema::value_t{"1"}},
                                 {"b", schema::value_t{"2"}},
                                 {"c", schema::value_t{"3"}}};
  auto schema = make_deferred_schema(executor, {"a", "b", "c"});

  auto deliveries = 0;
  auto delivered = std::optional<schema::sanidation_result_t>{};
  engine.check(record, schema, {},
               [&](schema::sanidation_result_t result) {
                 ++deliveries;
                 delivered = std::move(result);
               });

  ASSERT_EQ(executor.pending(), 3u);
  executor.run_back();
  executor.run_front();
  EXPECT_EQ(deliveries, 0);
  executor.run_all();

  EXPECT_EQ(deliveries, 1);
  ASSERT_TRUE(delivered.has_value());
  EXPECT_EQ(delivered->cleaned.size(), 3u);
  EXPECT_FALSE(delivered->errors.has_value());
}

TEST(engine_async, out_of_order_completion_keeps_field_attribution) {
  auto executor = sanidate::testing::deferred_executor{};
  auto engine = execution::engine{};
  auto record = schema::record_t{{"first", schema::value_t{"bad"}},
                                 {"second", schema::value_t{"ok"}},
                                 {"third", schema::value_t{"bad"}}};
  auto schema = make_deferred_schema(executor, {"first", "second", "third"});

  auto delivered = std::optional<schema::sanidation_result_t>{};
  engine.check(record, schema, {},
               [&delivered](schema::sanidation_result_t result) {
                 delivered = std::move(result);
               });
  executor.run_at(1);
  executor.run_back();
  EXPECT_FALSE(delivered.has_value());
  executor.run_front();

  ASSERT_TRUE(delivered.has_value());
  ASSERT_TRUE(delivered->errors.has_value());
  EXPECT_EQ(delivered->errors->count, 2u);
  EXPECT_EQ(delivered->errors->errors.at("first"), "custom");
  EXPECT_EQ(delivered->errors->errors.at("third"), "custom");
  EXPECT_EQ(delivered->cleaned.at("second"), schema::value_t{"ok"});
}

TEST(engine_async, mixed_chain_continues_after_deferred_step) {
  auto executor = sanidate::testing::deferred_executor{};
  auto engine = execution::engine{};
  auto schema = schema::schema_t{
      {"age", schema::field_schema_t{
                  schema::make_constraint("custom",
                                          make_deferred_custom(executor)),
                  "integer",
                  schema::make_constraint("min", schema::value_t{18},
                                          schema::value_t{true},
                                          schema::value_t{true})}}};

  auto delivered = std::optional<schema::sanidation_result_t>{};
  engine.check(schema::record_t{{"age", schema::value_t{"18"}}}, schema, {},
               [&delivered](schema::sanidation_result_t result) {
                 delivered = std::move(result);
               });
  EXPECT_FALSE(delivered.has_value());
  executor.run_all();

  ASSERT_TRUE(delivered.has_value());
  EXPECT_FALSE(delivered->errors.has_value());
  EXPECT_EQ(delivered->cleaned.at("age"), schema::value_t{18});
}

TEST(engine_async, completions_from_other_threads_join_once) {
  auto engine = execution::engine{};
  auto custom = schema::custom_fn_t{[](const schema::param_context_t&,
                                       const schema::value_t& value,
                                       schema::continuation_t next) {
    std::thread{[value, next = std::move(next)] {
      next(schema::make_outcome(value, "custom"));
    }}.detach();
  }};

  auto schema = schema::schema_t{};
  auto record = schema::record_t{};
  for (auto i = 0; i < 16; ++i) {
    auto field = "field" + std::to_string(i);
    record[field] = schema::value_t{i};
    schema[field] =
        schema::field_schema_t{schema::make_constraint("custom", custom)};
  }

  auto result = engine.check(record, schema).get();
  EXPECT_EQ(result.cleaned.size(), 16u);
  EXPECT_FALSE(result.errors.has_value());
  EXPECT_EQ(result.cleaned.at("field7"), schema::value_t{7});
}
