#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sanidate/constraints/builtins.hpp>
#include <string_view>

namespace sanidate::constraints {

namespace {

/// Furthest instant from the epoch a date may lie, in milliseconds.
constexpr auto kMaxEpochMilliseconds = int64_t{8'640'000'000'000'000};

class cursor final {
 public:
  explicit cursor(std::string_view text) : text_{text} {}

  bool done() const { return position_ >= text_.size(); }

  std::optional<char> peek() const {
    if (done()) {
      return std::nullopt;
    }
    return text_[position_];
  }

  bool consume(const char expected) {
    if (peek() == expected) {
      ++position_;
      return true;
    }
    return false;
  }

  /// Exactly `count` decimal digits.
  std::optional<int> digits(const std::size_t count) {
    if (position_ + count > text_.size()) {
      return std::nullopt;
    }
    auto value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      auto c = text_[position_ + i];
      if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
        return std::nullopt;
      }
      value = (value * 10) + (c - '0');
    }
    position_ += count;
    return value;
  }

  /// Fractional seconds of any length, truncated to milliseconds.
  std::optional<int> milliseconds() {
    auto value = 0;
    auto scale = 100;
    auto consumed = std::size_t{0};
    while (!done() &&
           std::isdigit(static_cast<unsigned char>(text_[position_])) != 0) {
      value += (text_[position_] - '0') * scale;
      scale /= 10;
      ++position_;
      ++consumed;
    }
    if (consumed == 0) {
      return std::nullopt;
    }
    return value;
  }

 private:
  std::string_view text_;
  std::size_t position_{};
};

std::string_view trim(std::string_view text) {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::optional<schema::date_t> from_epoch_milliseconds(const int64_t value) {
  if (value < -kMaxEpochMilliseconds || value > kMaxEpochMilliseconds) {
    return std::nullopt;
  }
  return schema::date_t{std::chrono::milliseconds{value}};
}

std::optional<schema::date_t> from_epoch_milliseconds(const double value) {
  if (!std::isfinite(value) ||
      std::fabs(value) > static_cast<double>(kMaxEpochMilliseconds)) {
    return std::nullopt;
  }
  return from_epoch_milliseconds(static_cast<int64_t>(std::trunc(value)));
}

}  // namespace

std::optional<schema::date_t> parse_date(std::string_view text) {
  auto input = cursor{trim(text)};

  auto year = input.digits(4);
  if (!year || !input.consume('-')) {
    return std::nullopt;
  }
  auto month = input.digits(2);
  if (!month || !input.consume('-')) {
    return std::nullopt;
  }
  auto day = input.digits(2);
  if (!day) {
    return std::nullopt;
  }
  auto calendar = std::chrono::year_month_day{
      std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!calendar.ok()) {
    return std::nullopt;
  }

  auto time_of_day = std::chrono::milliseconds{0};
  if (input.consume('T') || input.consume(' ')) {
    auto hours = input.digits(2);
    if (!hours || !input.consume(':')) {
      return std::nullopt;
    }
    auto minutes = input.digits(2);
    if (!minutes || *hours > 23 || *minutes > 59) {
      return std::nullopt;
    }
    auto seconds = 0;
    auto millis = 0;
    if (input.consume(':')) {
      auto parsed_seconds = input.digits(2);
      if (!parsed_seconds || *parsed_seconds > 59) {
        return std::nullopt;
      }
      seconds = *parsed_seconds;
      if (input.consume('.')) {
        auto parsed_millis = input.milliseconds();
        if (!parsed_millis) {
          return std::nullopt;
        }
        millis = *parsed_millis;
      }
    }
    time_of_day = std::chrono::hours{*hours} + std::chrono::minutes{*minutes} +
                  std::chrono::seconds{seconds} +
                  std::chrono::milliseconds{millis};

    auto sign = input.peek();
    if (!input.consume('Z') && (sign == '+' || sign == '-')) {
      input.consume(*sign);
      auto offset_hours = input.digits(2);
      if (!offset_hours) {
        return std::nullopt;
      }
      input.consume(':');
      auto offset_minutes = input.digits(2);
      if (!offset_minutes || *offset_hours > 23 || *offset_minutes > 59) {
        return std::nullopt;
      }
      auto offset = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::hours{*offset_hours} +
          std::chrono::minutes{*offset_minutes});
      time_of_day += *sign == '+' ? -offset : offset;
    }
  }
  if (!input.done()) {
    return std::nullopt;
  }

  return schema::date_t{std::chrono::sys_days{calendar}} + time_of_day;
}

schema::evaluator_t make_date(const schema::arguments_t&,
                              const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    auto parsed = std::optional<schema::date_t>{};
    if (const auto* date = value.get_if<schema::date_t>()) {
      parsed = *date;
    } else if (const auto* integer = value.get_if<int64_t>()) {
      parsed = from_epoch_milliseconds(*integer);
    } else if (const auto* number = value.get_if<double>()) {
      parsed = from_epoch_milliseconds(*number);
    } else if (const auto* text = value.get_if<std::string>()) {
      parsed = parse_date(*text);
    }
    if (!parsed) {
      return schema::make_outcome(schema::make_invalid(), "date");
    }
    return schema::make_outcome(*parsed, "date");
  }};
}

}  // namespace sanidate::constraints
