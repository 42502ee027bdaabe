#pragma once

#include <nhs_number/schema/nhs_number.hpp>
#include <nhs_number/schema/parse_error.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>

namespace nhs_number::schema {

inline constexpr std::size_t kUngroupedLength{kDigitCount};
inline constexpr std::size_t kGroupedLength{kDigitCount + 2};
inline constexpr char kSeparator{' '};
// Separator indices within the 12-character "DDD DDD DDDD" form.
inline constexpr std::array<std::size_t, 2> kSeparatorPositions{3, 7};

using parse_result_t = std::variant<nhs_number_t, parse_error_t>;

/// Accepts exactly "DDDDDDDDDD" or "DDD DDD DDDD". Nothing else is trimmed
/// or normalized; on failure no partial value is produced.
parse_result_t parse_nhs_number(std::string_view input);

std::optional<nhs_number_t> try_parse_nhs_number(std::string_view input);

}  // namespace nhs_number::schema
