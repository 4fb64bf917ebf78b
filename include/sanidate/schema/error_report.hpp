#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace sanidate::schema {

struct error_report_t final {
  uint32_t count{};
  /// Field name -> name of the constraint that failed it.
  std::map<std::string, std::string> errors;
  /// Field name -> message, for fields failed by an explicit leaf error.
  std::map<std::string, std::string> leaf_errors;

  bool operator==(const error_report_t&) const = default;
};

}  // namespace sanidate::schema
