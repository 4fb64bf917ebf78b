#include <algorithm>
#include <array>
#include <iterator>
#include <sanidate/constraints/builtins.hpp>
#include <string_view>

namespace sanidate::constraints {

namespace {

inline constexpr auto kTrueTokens =
    std::array<std::string_view, 4>{"true", "yes", "1", "on"};
inline constexpr auto kFalseTokens =
    std::array<std::string_view, 4>{"false", "no", "0", "off"};

template <std::size_t N>
bool is_token(const schema::value_t& value,
              const std::array<std::string_view, N>& tokens) {
  const auto* text = value.get_if<std::string>();
  if (text == nullptr) {
    return false;
  }
  return std::find(std::begin(tokens), std::end(tokens), *text) !=
         std::end(tokens);
}

}  // namespace

schema::evaluator_t make_is_true(const schema::arguments_t&,
                                 const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    return schema::make_outcome(is_token(value, kTrueTokens), "isTrue");
  }};
}

schema::evaluator_t make_is_not_false(const schema::arguments_t&,
                                      const schema::param_context_t&) {
  return schema::sync_evaluator_t{[](const schema::value_t& value) {
    return schema::make_outcome(!is_token(value, kFalseTokens), "isNotFalse");
  }};
}

}  // namespace sanidate::constraints
