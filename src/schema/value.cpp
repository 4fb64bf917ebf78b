#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <ostream>
#include <sanidate/schema/document.hpp>
#include <sanidate/schema/primitives.hpp>
#include <sanidate/schema/value.hpp>
#include <system_error>

namespace sanidate::schema {

namespace {

std::string_view skip_whitespace(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  return text;
}

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string format_number(const double value) {
  if (std::isnan(value)) {
    return "NaN";
  }
  if (std::isinf(value)) {
    return value > 0 ? "Infinity" : "-Infinity";
  }
  if (value == 0.0) {
    return "0";
  }
  auto buffer = std::array<char, 32>{};
  auto [end, error] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (error != std::errc{}) {
    return std::to_string(value);
  }
  return std::string{buffer.data(), end};
}

void append_padded(std::string& out, const int64_t value, const int width) {
  auto digits = std::to_string(value);
  for (auto i = static_cast<int>(digits.size()); i < width; ++i) {
    out.push_back('0');
  }
  out += digits;
}

struct civil_date_t final {
  int64_t year{};
  int64_t month{};
  int64_t day{};
};

// std::chrono::year stops at +/-32767, short of the full date range.
civil_date_t to_civil(const int64_t days_since_epoch) {
  auto z = days_since_epoch + 719468;
  auto era = (z >= 0 ? z : z - 146096) / 146097;
  auto day_of_era = z - era * 146097;
  auto year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 -
                      day_of_era / 146096) /
                     365;
  auto day_of_year =
      day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
  auto shifted_month = (5 * day_of_year + 2) / 153;
  auto month = shifted_month < 10 ? shifted_month + 3 : shifted_month - 9;
  return civil_date_t{
      .year = year_of_era + era * 400 + (month <= 2 ? 1 : 0),
      .month = month,
      .day = day_of_year - (153 * shifted_month + 2) / 5 + 1};
}

}  // namespace

value_t::value_t(undefined_t) : data_{undefined_t{}} {}
value_t::value_t(invalid_t) : data_{invalid_t{}} {}
value_t::value_t(std::nullptr_t) : data_{nullptr} {}
value_t::value_t(const bool value) : data_{value} {}
value_t::value_t(const int value) : data_{static_cast<int64_t>(value)} {}
value_t::value_t(const int64_t value) : data_{value} {}
value_t::value_t(const double value) : data_{value} {}
value_t::value_t(std::string value) : data_{std::move(value)} {}
value_t::value_t(const std::string_view value)
    : data_{std::string{value}} {}
value_t::value_t(const char* value) : data_{std::string{value}} {}
value_t::value_t(const date_t value) : data_{value} {}
value_t::value_t(document_ptr_t value) : data_{std::move(value)} {}

bool value_t::operator==(const value_t& other) const {
  if (data_.index() != other.data_.index()) {
    return false;
  }
  if (auto* document = std::get_if<document_ptr_t>(&data_)) {
    auto& other_document = std::get<document_ptr_t>(other.data_);
    if (!*document || !other_document) {
      return *document == other_document;
    }
    return **document == *other_document;
  }
  return data_ == other.data_;
}

value_t make_undefined() {
  return value_t{undefined_t{}};
}

value_t make_invalid() {
  return value_t{invalid_t{}};
}

bool is_undefined(const value_t& value) {
  return value.is<undefined_t>();
}

bool is_null(const value_t& value) {
  return value.is<std::nullptr_t>();
}

bool is_empty(const value_t& value) {
  return is_undefined(value) || is_null(value);
}

bool is_invalid(const value_t& value) {
  return value.is<invalid_t>();
}

bool is_truthy(const value_t& value) {
  return std::visit(
      overloaded{[](const undefined_t&) { return false; },
                 [](const std::nullptr_t&) { return false; },
                 [](const bool flag) { return flag; },
                 [](const int64_t number) { return number != 0; },
                 [](const double number) {
                   return !std::isnan(number) && number != 0.0;
                 },
                 [](const std::string& text) { return !text.empty(); },
                 [](const date_t&) { return true; },
                 [](const document_ptr_t& document) {
                   return static_cast<bool>(document);
                 },
                 [](const invalid_t&) { return false; }},
      value.data());
}

std::string to_string(const value_t& value) {
  return std::visit(
      overloaded{[](const undefined_t&) { return std::string{"undefined"}; },
                 [](const std::nullptr_t&) { return std::string{"null"}; },
                 [](const bool flag) {
                   return std::string{flag ? "true" : "false"};
                 },
                 [](const int64_t number) { return std::to_string(number); },
                 [](const double number) { return format_number(number); },
                 [](const std::string& text) { return text; },
                 [](const date_t& date) { return format_date(date); },
                 [](const document_ptr_t& document) {
                   if (!document) {
                     return std::string{"null"};
                   }
                   return document->collection + "/" + document->id;
                 },
                 [](const invalid_t&) { return std::string{"invalid"}; }},
      value.data());
}

std::string_view type_name(const value_t& value) {
  static constexpr auto kNames = std::array<std::string_view, 9>{
      "undefined", "null", "bool",     "integer", "number",
      "string",    "date", "document", "invalid"};
  return kNames[value.data().index()];
}

std::optional<double> parse_float_prefix(std::string_view text) {
  text = skip_whitespace(text);
  auto negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.starts_with("Infinity")) {
    return negative ? -HUGE_VAL : HUGE_VAL;
  }
  if (text.empty() || (!is_digit(text.front()) && text.front() != '.')) {
    return std::nullopt;
  }
  auto parsed = double{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (error == std::errc::invalid_argument) {
    return std::nullopt;
  }
  if (error == std::errc::result_out_of_range) {
    parsed = std::strtod(std::string{text.data(), end}.c_str(), nullptr);
  }
  return negative ? -parsed : parsed;
}

std::optional<int64_t> parse_integer_prefix(std::string_view text) {
  text = skip_whitespace(text);
  auto negative = false;
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty() || !is_digit(text.front())) {
    return std::nullopt;
  }
  auto digits = std::string{negative ? "-" : ""};
  while (!text.empty() && is_digit(text.front())) {
    digits.push_back(text.front());
    text.remove_prefix(1);
  }
  auto parsed = int64_t{};
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (error != std::errc{}) {
    return std::nullopt;
  }
  return parsed;
}

std::string format_date(const date_t& date) {
  auto day_point = std::chrono::floor<std::chrono::days>(date);
  auto calendar = to_civil(day_point.time_since_epoch().count());
  auto time = std::chrono::hh_mm_ss<std::chrono::milliseconds>{
      date - day_point};

  auto out = std::string{};
  out.reserve(27);
  if (calendar.year < 0 || calendar.year > 9999) {
    out.push_back(calendar.year < 0 ? '-' : '+');
    append_padded(out, calendar.year < 0 ? -calendar.year : calendar.year, 6);
  } else {
    append_padded(out, calendar.year, 4);
  }
  out.push_back('-');
  append_padded(out, calendar.month, 2);
  out.push_back('-');
  append_padded(out, calendar.day, 2);
  out.push_back('T');
  append_padded(out, time.hours().count(), 2);
  out.push_back(':');
  append_padded(out, time.minutes().count(), 2);
  out.push_back(':');
  append_padded(out, time.seconds().count(), 2);
  out.push_back('.');
  append_padded(out, time.subseconds().count(), 3);
  out.push_back('Z');
  return out;
}

std::ostream& operator<<(std::ostream& out, const value_t& value) {
  if (value.is<std::string>()) {
    return out << '"' << value.get<std::string>() << '"';
  }
  return out << type_name(value) << '(' << to_string(value) << ')';
}

}  // namespace sanidate::schema
