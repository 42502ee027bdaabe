#include <nhs_number/schema/parser.hpp>

#include <algorithm>

namespace nhs_number::schema {

namespace {

bool is_separator_position(const std::size_t index) {
  return std::ranges::find(kSeparatorPositions, index) !=
         std::end(kSeparatorPositions);
}

}  // namespace

parse_result_t parse_nhs_number(const std::string_view input) {
  if (input.size() != kUngroupedLength && input.size() != kGroupedLength) {
    return parse_error_t{.code = parse_error_code_t::invalid_length,
                         .position = input.size()};
  }

  auto grouped = input.size() == kGroupedLength;
  auto value = nhs_number_t{};
  auto next = std::size_t{0};
  for (std::size_t i = 0; i < input.size(); ++i) {
    if (grouped && is_separator_position(i)) {
      if (input[i] != kSeparator) {
        return parse_error_t{.code = parse_error_code_t::missing_separator,
                             .position = i};
      }
      continue;
    }
    if (!is_ascii_digit(input[i])) {
      return parse_error_t{.code = parse_error_code_t::invalid_digit,
                           .position = i};
    }
    value.digits[next++] = static_cast<digit_t>(input[i] - '0');
  }
  return value;
}

std::optional<nhs_number_t> try_parse_nhs_number(const std::string_view input) {
  auto result = parse_nhs_number(input);
  if (auto* value = std::get_if<nhs_number_t>(&result)) {
    return *value;
  }
  return std::nullopt;
}

}  // namespace nhs_number::schema
