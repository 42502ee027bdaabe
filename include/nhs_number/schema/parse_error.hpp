#pragma once

#include <nhs_number/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: parse error.
// Why a candidate string is not an NHS number, and where parsing stopped.
namespace nhs_number::schema {

enum class parse_error_code_t : uint8_t {
  invalid_length = 1,
  invalid_digit = 2,
  missing_separator = 3,
};

inline constexpr auto kParseErrorCodeMappings = std::array{
    std::pair<std::string_view, parse_error_code_t>{
        "invalid_length", parse_error_code_t::invalid_length},
    std::pair<std::string_view, parse_error_code_t>{
        "invalid_digit", parse_error_code_t::invalid_digit},
    std::pair<std::string_view, parse_error_code_t>{
        "missing_separator", parse_error_code_t::missing_separator},
};

template <>
inline std::optional<parse_error_code_t> try_from_string<parse_error_code_t>(
    const std::string_view value) {
  return from_string(value, kParseErrorCodeMappings);
}

inline constexpr std::string_view to_string(const parse_error_code_t value) {
  return to_string(value, kParseErrorCodeMappings).value_or("unknown");
}

struct parse_error_t final {
  parse_error_code_t code{parse_error_code_t::invalid_length};
  // Index of the offending character; the input length for invalid_length.
  std::size_t position{};

  friend bool operator==(const parse_error_t&, const parse_error_t&) = default;
};

}  // namespace nhs_number::schema
