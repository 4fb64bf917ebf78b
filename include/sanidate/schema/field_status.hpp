#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: field status.
// Terminal state of one field's constraint chain.
namespace sanidate::schema {

enum class field_status_t : uint8_t { succeeded = 0, failed = 1 };

inline constexpr auto kFieldStatusNames =
    std::array{std::pair<std::string_view, field_status_t>{
                   "succeeded", field_status_t::succeeded},
               std::pair<std::string_view, field_status_t>{
                   "failed", field_status_t::failed}};

inline constexpr std::string_view to_string(const field_status_t status) {
  for (const auto& [name, value] : kFieldStatusNames) {
    if (value == status) {
      return name;
    }
  }
  return "unknown";
}

inline constexpr std::optional<field_status_t> parse_field_status(
    const std::string_view text) {
  for (const auto& [name, value] : kFieldStatusNames) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace sanidate::schema
