#pragma once
#include <functional>
#include <sanidate/schema/constraint_spec.hpp>
#include <sanidate/schema/evaluator.hpp>
#include <sanidate/schema/sanidation_result.hpp>
#include <sanidate/schema/value.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Translation between command-line arguments and records, schemas and
// results for the `sanidate` executable.
namespace sanidate::tools {

/// Malformed command-line argument.
struct usage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Turns a collection name into a lookup for the document constraints.
using collection_resolver_t =
    std::function<schema::document_lookup_t(const std::string& collection)>;

inline constexpr auto kExitSucceeded = 0;
inline constexpr auto kExitFieldsFailed = 1;
inline constexpr auto kExitUsage = 2;

/// `name=value`; the value is kept as a string.
std::pair<std::string, schema::value_t> parse_field(std::string_view argument);

/// `true`/`false`, integers, decimals and `/regex/`; anything else is a
/// string.
schema::argument_t parse_literal(std::string_view text);

/// `field=name[:arg...]`. `resolver` is required for `isDocument` and
/// `isNotDocument`, whose first argument names a collection.
std::pair<std::string, schema::constraint_spec_t> parse_constraint(
    std::string_view argument,
    const collection_resolver_t& resolver);

schema::record_t make_record(const std::vector<std::string>& fields);

/// Constraints are appended to their field's chain in argument order.
schema::schema_t make_schema(const std::vector<std::string>& constraints,
                             const collection_resolver_t& resolver);

/// `name: value` per cleaned field, then `errors: N` and one
/// `field: constraint` line per failure.
std::string format_result(const schema::sanidation_result_t& result);

int exit_code(const schema::sanidation_result_t& result);

}  // namespace sanidate::tools
