#include <cctype>
#include <regex>
#include <sanidate/constraints/arguments.hpp>
#include <sanidate/constraints/builtins.hpp>
#include <string>

namespace sanidate::constraints {

namespace {

const std::regex& email_pattern() {
  static const auto pattern = std::regex{
      R"re(^(([^<>()\[\]\\.,;:\s@"]+(\.[^<>()\[\]\\.,;:\s@"]+)*)|(".+"))@((\[[0-9]{1,3}\.[0-9]{1,3}\.[0-9]{1,3}\.[0-9]{1,3}\])|(([a-zA-Z0-9-]+\.)+[a-zA-Z]{2,}))$)re"};
  return pattern;
}

const std::regex& zip_pattern() {
  static const auto pattern = std::regex{R"re(^\d{5}$)re"};
  return pattern;
}

const std::regex& phone_pattern() {
  static const auto pattern = std::regex{R"re(^\(?\d{3}\)? ?\d{3}-?\d{4}$)re"};
  return pattern;
}

std::string extract_digits(const std::string& text) {
  auto digits = std::string{};
  for (const auto c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      digits.push_back(c);
    }
  }
  return digits;
}

std::string format_phone(const std::string& text) {
  auto digits = extract_digits(text);
  return "(" + digits.substr(0, 3) + ") " + digits.substr(3, 3) + "-" +
         digits.substr(6);
}

}  // namespace

schema::evaluator_t make_required(const schema::arguments_t&,
                                  const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    return schema::make_outcome(
        schema::is_truthy(value) ? value : schema::make_invalid(), "required");
  }};
}

schema::evaluator_t make_match(const schema::arguments_t& arguments,
                               const schema::param_context_t& context) {
  auto pattern = detail::require_argument<std::regex>(
      arguments, 0, "match", context, "a pattern");
  return schema::sync_evaluator_t{
      [pattern = std::move(pattern)](const schema::value_t& value) {
        auto text = schema::to_string(value);
        auto matched =
            text.size() <= kMaxMatchLength && std::regex_search(text, pattern);
        return schema::make_outcome(matched ? value : schema::make_invalid(),
                                    "match");
      }};
}

schema::evaluator_t make_email(const schema::arguments_t&,
                               const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    auto text = schema::to_string(value);
    auto matched = text.size() <= kMaxEmailLength &&
                   std::regex_search(text, email_pattern());
    return schema::make_outcome(matched ? value : schema::make_invalid(),
                                "email");
  }};
}

schema::evaluator_t make_zip(const schema::arguments_t&,
                             const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    auto matched = std::regex_search(schema::to_string(value), zip_pattern());
    return schema::make_outcome(matched ? value : schema::make_invalid(),
                                "zip");
  }};
}

schema::evaluator_t make_phone(const schema::arguments_t& arguments,
                               const schema::param_context_t& context) {
  auto digits_only = detail::flag_argument(arguments, 0, "phone", context);
  return schema::sync_evaluator_t{
      [digits_only](const schema::value_t& value) {
        auto text = schema::to_string(value);
        if (!std::regex_search(text, phone_pattern())) {
          return schema::make_outcome(schema::make_invalid(), "phone");
        }
        return schema::make_outcome(
            digits_only ? extract_digits(text) : format_phone(text), "phone");
      }};
}

}  // namespace sanidate::constraints
