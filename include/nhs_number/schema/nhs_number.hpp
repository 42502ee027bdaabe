#pragma once

#include <nhs_number/schema/primitives.hpp>

#include <compare>
#include <optional>
#include <ostream>
#include <string>

// Schema type: NHS number.
// Patient identity: ten-digit identifier shared by the public health services
// of England, Wales and the Isle of Man. The last digit is a check digit over
// the first nine; canonical text form is "DDD DDD DDDD".
namespace nhs_number::schema {

struct nhs_number_t final {
  digits_t digits{};

  /// Stored check digit, i.e. the last digit. Not recomputed.
  digit_t check_digit() const;

  /// Check digit the first nine digits call for.
  digit_t calculate_check_digit() const;

  /// True when the stored check digit matches the calculated one.
  bool validate_check_digit() const;

  /// Random sample from the reserved, never-issued test range.
  static nhs_number_t testable_random_sample();

  friend auto operator<=>(const nhs_number_t&, const nhs_number_t&) = default;
};

/// Build from a digit literal. Digits outside [0, 9] are fatal.
nhs_number_t make_nhs_number(const digits_t& digits);
std::optional<nhs_number_t> try_make_nhs_number(const digits_t& digits);

/// Canonical "DDD DDD DDDD" form. Never emits the ungrouped form.
/// Every digit must be in [0, 9]; values from make_, try_make_, the parser,
/// the decoder and the sampler always are.
std::string format(const digits_t& digits);
std::string to_string(const nhs_number_t& value);

std::ostream& operator<<(std::ostream& out, const nhs_number_t& value);

}  // namespace nhs_number::schema
