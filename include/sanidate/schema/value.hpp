#pragma once
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sanidate::schema {

/// Field absent from the submitted record.
struct undefined_t final {
  bool operator==(const undefined_t&) const = default;
};

/// Marker produced by a constraint that rejects its input.
///
/// Kept as its own alternative so it can never compare equal to legitimate
/// falsy data (`0`, `""`, `false`, `null`).
struct invalid_t final {
  bool operator==(const invalid_t&) const = default;
};

using date_t = std::chrono::sys_time<std::chrono::milliseconds>;

template <uint16_t Version>
struct document;

using document_ptr_t = std::shared_ptr<const document<1>>;

/// Value threaded through a constraint chain.
class value_t final {
 public:
  using variant_t = std::variant<undefined_t,
                                 std::nullptr_t,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 date_t,
                                 document_ptr_t,
                                 invalid_t>;

  value_t() = default;
  value_t(undefined_t);
  value_t(invalid_t);
  value_t(std::nullptr_t);
  value_t(bool value);
  value_t(int value);
  value_t(int64_t value);
  value_t(double value);
  value_t(std::string value);
  value_t(std::string_view value);
  value_t(const char* value);
  value_t(date_t value);
  value_t(document_ptr_t value);

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(data_);
  }

  template <typename T>
  const T& get() const {
    return std::get<T>(data_);
  }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&data_);
  }

  const variant_t& data() const { return data_; }

  bool operator==(const value_t& other) const;

 private:
  variant_t data_;
};

using record_t = std::map<std::string, value_t>;

value_t make_undefined();
value_t make_invalid();

bool is_undefined(const value_t& value);
bool is_null(const value_t& value);
/// True for `null` and `undefined`.
bool is_empty(const value_t& value);
bool is_invalid(const value_t& value);

/// Truthiness as form input is usually judged: `undefined`, `null`, `false`,
/// `0`, NaN, `""` and the invalid marker are falsy, everything else truthy.
bool is_truthy(const value_t& value);

/// String form of a value (`undefined` -> "undefined", `null` -> "null",
/// numbers in shortest round-trip notation, dates as ISO-8601 UTC).
std::string to_string(const value_t& value);

/// Name of the held alternative, for log lines and diagnostics.
std::string_view type_name(const value_t& value);

/// Parses the longest leading decimal number, skipping leading whitespace.
/// Returns std::nullopt when no digits can be consumed.
std::optional<double> parse_float_prefix(std::string_view text);

/// Parses the longest leading base-10 integer, skipping leading whitespace.
/// Returns std::nullopt when no digits can be consumed or on overflow.
std::optional<int64_t> parse_integer_prefix(std::string_view text);

/// Formats a date as `YYYY-MM-DDTHH:MM:SS.sssZ`; years outside 0..9999 use
/// the signed six-digit form `+YYYYYY`.
std::string format_date(const date_t& date);

std::ostream& operator<<(std::ostream& out, const value_t& value);

}  // namespace sanidate::schema
