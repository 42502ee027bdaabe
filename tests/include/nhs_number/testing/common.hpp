#pragma once

#include <nhs_number/schema/nhs_number.hpp>

#include <cstddef>
#include <string>

namespace nhs_number::testing {

// 012 345 6789
inline nhs_number::schema::nhs_number_t make_sequential() {
  return nhs_number::schema::nhs_number_t{
      .digits = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9}};
}

// 943 476 5919: weighted sum 299, remainder 2, check digit 9.
inline nhs_number::schema::nhs_number_t make_worked_example() {
  return nhs_number::schema::nhs_number_t{
      .digits = {9, 4, 3, 4, 7, 6, 5, 9, 1, 9}};
}

// Every digit equal to seed % 10.
inline nhs_number::schema::digits_t make_repeated_digits(const std::size_t seed) {
  auto digits = nhs_number::schema::digits_t{};
  for (auto& digit : digits) {
    digit = static_cast<nhs_number::schema::digit_t>(seed % 10);
  }
  return digits;
}

inline std::string ungrouped(const nhs_number::schema::nhs_number_t& value) {
  auto out = std::string{};
  for (const auto digit : value.digits) {
    out.push_back(static_cast<char>('0' + digit));
  }
  return out;
}

}  // namespace nhs_number::testing
