#pragma once
#include <optional>
#include <sanidate/schema/error_report.hpp>
#include <sanidate/schema/value.hpp>

namespace sanidate::schema {

struct sanidation_result_t final {
  record_t cleaned;
  /// Absent when every field succeeded.
  std::optional<error_report_t> errors;
};

}  // namespace sanidate::schema
