#include <nhs_number/schema/checksum.hpp>

namespace nhs_number::schema {

digit_t check_digit(const digits_t& digits) {
  return digits[kCheckDigitIndex];
}

uint32_t checksum_remainder(const digits_t& digits) {
  auto sum = uint32_t{0};
  for (std::size_t i = 0; i < kCheckDigitIndex; ++i) {
    auto weight = static_cast<uint32_t>(kDigitCount - i);
    sum += static_cast<uint32_t>(digits[i]) * weight;
  }
  return sum % kChecksumModulus;
}

digit_t calculate_check_digit(const digits_t& digits) {
  // Folds both special cases: a checksum of 11 comes out as 1 and an
  // unrepresentable checksum of 10 comes out as 0. Callers that need the
  // distinction use is_check_digit_representable.
  auto remainder = checksum_remainder(digits);
  return static_cast<digit_t>((kChecksumModulus - remainder) % 10u);
}

bool validate_check_digit(const digits_t& digits) {
  return check_digit(digits) == calculate_check_digit(digits);
}

bool is_check_digit_representable(const digits_t& digits) {
  return (kChecksumModulus - checksum_remainder(digits)) != 10u;
}

}  // namespace nhs_number::schema
