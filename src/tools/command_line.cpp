#include <charconv>
#include <cstdint>
#include <regex>
#include <sanidate/tools/command_line.hpp>
#include <sstream>
#include <system_error>

namespace sanidate::tools {

namespace {

bool is_document_constraint(const std::string_view name) {
  return name == "isDocument" || name == "isNotDocument";
}

// Splits on ':' except inside a `/regex/` segment.
std::vector<std::string> split_arguments(std::string_view text) {
  auto parts = std::vector<std::string>{};
  while (true) {
    auto end = std::string_view::npos;
    if (text.starts_with('/')) {
      auto search = std::size_t{1};
      while (true) {
        auto slash = text.find('/', search);
        if (slash == std::string_view::npos) {
          break;
        }
        if (slash + 1 == text.size() || text[slash + 1] == ':') {
          end = slash + 1 == text.size() ? std::string_view::npos : slash + 1;
          break;
        }
        search = slash + 1;
      }
    } else {
      end = text.find(':');
    }
    parts.emplace_back(text.substr(0, end));
    if (end == std::string_view::npos) {
      return parts;
    }
    text.remove_prefix(end + 1);
  }
}

}  // namespace

std::pair<std::string, schema::value_t> parse_field(
    const std::string_view argument) {
  auto equals = argument.find('=');
  if (equals == std::string_view::npos || equals == 0) {
    throw usage_error{"expected name=value, got '" + std::string{argument} +
                      "'"};
  }
  return {std::string{argument.substr(0, equals)},
          schema::value_t{std::string{argument.substr(equals + 1)}}};
}

schema::argument_t parse_literal(const std::string_view text) {
  static const auto kInteger = std::regex{R"(^[+-]?\d+$)"};
  static const auto kDecimal =
      std::regex{R"(^[+-]?(\d+\.\d*|\.\d+|\d+)([eE][+-]?\d+)?$)"};

  if (text == "true") {
    return schema::value_t{true};
  }
  if (text == "false") {
    return schema::value_t{false};
  }
  if (text.size() >= 2 && text.front() == '/' && text.back() == '/') {
    try {
      return std::regex{std::string{text.substr(1, text.size() - 2)}};
    } catch (const std::regex_error& ex) {
      throw usage_error{"invalid regular expression " + std::string{text} +
                        ": " + ex.what()};
    }
  }

  auto owned = std::string{text};
  if (std::regex_match(owned, kInteger)) {
    auto digits = text.starts_with('+') ? text.substr(1) : text;
    auto parsed = int64_t{};
    auto [end, error] =
        std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (error == std::errc{} && end == digits.data() + digits.size()) {
      return schema::value_t{parsed};
    }
  }
  if (std::regex_match(owned, kDecimal)) {
    if (auto number = schema::parse_float_prefix(text)) {
      return schema::value_t{*number};
    }
  }
  return schema::value_t{std::move(owned)};
}

std::pair<std::string, schema::constraint_spec_t> parse_constraint(
    const std::string_view argument,
    const collection_resolver_t& resolver) {
  auto equals = argument.find('=');
  if (equals == std::string_view::npos || equals == 0 ||
      equals + 1 == argument.size()) {
    throw usage_error{"expected field=constraint[:arg...], got '" +
                      std::string{argument} + "'"};
  }
  auto field = std::string{argument.substr(0, equals)};
  auto parts = split_arguments(argument.substr(equals + 1));
  auto name = parts.front();

  auto arguments = schema::arguments_t{};
  auto first = std::size_t{1};
  if (is_document_constraint(name)) {
    if (parts.size() < 2 || parts[1].empty()) {
      throw usage_error{name + " needs a collection name"};
    }
    if (!resolver) {
      throw usage_error{name + " needs a document store (--documents)"};
    }
    arguments.emplace_back(resolver(parts[1]));
    first = 2;
  }
  for (auto i = first; i < parts.size(); ++i) {
    arguments.push_back(parse_literal(parts[i]));
  }
  return {std::move(field),
          schema::constraint_spec_t{std::move(name), std::move(arguments)}};
}

schema::record_t make_record(const std::vector<std::string>& fields) {
  auto record = schema::record_t{};
  for (const auto& argument : fields) {
    auto [name, value] = parse_field(argument);
    record.insert_or_assign(std::move(name), std::move(value));
  }
  return record;
}

schema::schema_t make_schema(const std::vector<std::string>& constraints,
                             const collection_resolver_t& resolver) {
  auto schema = schema::schema_t{};
  for (const auto& argument : constraints) {
    auto [field, constraint] = parse_constraint(argument, resolver);
    schema[field].push_back(std::move(constraint));
  }
  return schema;
}

std::string format_result(const schema::sanidation_result_t& result) {
  auto out = std::ostringstream{};
  for (const auto& [name, value] : result.cleaned) {
    out << name << ": " << schema::to_string(value) << '\n';
  }
  if (!result.errors) {
    out << "errors: 0\n";
    return out.str();
  }
  out << "errors: " << result.errors->count << '\n';
  for (const auto& [field, constraint] : result.errors->errors) {
    out << field << ": " << constraint;
    auto leaf = result.errors->leaf_errors.find(field);
    if (leaf != std::end(result.errors->leaf_errors)) {
      out << " (" << leaf->second << ')';
    }
    out << '\n';
  }
  return out.str();
}

int exit_code(const schema::sanidation_result_t& result) {
  return result.errors ? kExitFieldsFailed : kExitSucceeded;
}

}  // namespace sanidate::tools
