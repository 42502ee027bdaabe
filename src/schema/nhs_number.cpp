#include <nhs_number/common/critical.hpp>
#include <nhs_number/schema/checksum.hpp>
#include <nhs_number/schema/nhs_number.hpp>
#include <nhs_number/schema/testable.hpp>

#include <algorithm>

namespace nhs_number::schema {

namespace {

// Group boundaries of the canonical 3-3-4 layout, in digit indices.
constexpr std::size_t kFirstGroupEnd{3};
constexpr std::size_t kSecondGroupEnd{6};

}  // namespace

digit_t nhs_number_t::check_digit() const {
  return schema::check_digit(digits);
}

digit_t nhs_number_t::calculate_check_digit() const {
  return schema::calculate_check_digit(digits);
}

bool nhs_number_t::validate_check_digit() const {
  return schema::validate_check_digit(digits);
}

nhs_number_t nhs_number_t::testable_random_sample() {
  return schema::testable_random_sample();
}

nhs_number_t make_nhs_number(const digits_t& digits) {
  auto value = try_make_nhs_number(digits);
  if (!value) {
    common::critical("make_nhs_number expected every digit in [0, 9]");
  }
  return *value;
}

std::optional<nhs_number_t> try_make_nhs_number(const digits_t& digits) {
  if (!std::ranges::all_of(digits, is_digit_value)) {
    return std::nullopt;
  }
  return nhs_number_t{.digits = digits};
}

std::string format(const digits_t& digits) {
  auto out = std::string{};
  out.reserve(kDigitCount + 2);
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i == kFirstGroupEnd || i == kSecondGroupEnd) {
      out.push_back(' ');
    }
    out.push_back(static_cast<char>('0' + digits[i]));
  }
  return out;
}

std::string to_string(const nhs_number_t& value) {
  return format(value.digits);
}

std::ostream& operator<<(std::ostream& out, const nhs_number_t& value) {
  return out << format(value.digits);
}

}  // namespace nhs_number::schema
