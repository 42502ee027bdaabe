#pragma once

#include <nhs_number/schema/primitives.hpp>

#include <cstdint>

// Check digit arithmetic over the raw digit array.
//
// Each of the first nine digits is weighted by (10 - index), the weighted sum
// is reduced modulo 11 and the check digit is (11 - remainder) % 10.
namespace nhs_number::schema {

inline constexpr uint32_t kChecksumModulus{11};

digit_t check_digit(const digits_t& digits);

uint32_t checksum_remainder(const digits_t& digits);

digit_t calculate_check_digit(const digits_t& digits);

bool validate_check_digit(const digits_t& digits);

/// False when 11 - remainder is 10, the case the published algorithm calls
/// invalid. calculate_check_digit still yields 0 for those numbers.
bool is_check_digit_representable(const digits_t& digits);

}  // namespace nhs_number::schema
