#pragma once

#include <nhs_number/schema/nhs_number.hpp>

#include <random>

// Reserved test range: 999 000 0000 to 999 999 9999 is valid syntax but is
// guaranteed never to be issued to a patient.
namespace nhs_number::schema {

inline constexpr std::size_t kTestablePrefixLength{3};

inline constexpr nhs_number_t kTestableMin{
    .digits = {9, 9, 9, 0, 0, 0, 0, 0, 0, 0}};
inline constexpr nhs_number_t kTestableMax{
    .digits = {9, 9, 9, 9, 9, 9, 9, 9, 9, 9}};

/// Inclusive membership of [kTestableMin, kTestableMax].
constexpr bool is_testable(const nhs_number_t& value) {
  return kTestableMin <= value && value <= kTestableMax;
}

/// Fixed 9,9,9 prefix followed by seven uniform digits. The check digit is
/// drawn like the others and is not corrected.
template <typename Generator>
nhs_number_t testable_random_sample(Generator& generator) {
  auto distribution = std::uniform_int_distribution<int>{0, 9};
  auto sample = kTestableMin;
  for (auto i = kTestablePrefixLength; i < kDigitCount; ++i) {
    sample.digits[i] = static_cast<digit_t>(distribution(generator));
  }
  return sample;
}

/// Draws from a thread-local engine seeded once per thread.
nhs_number_t testable_random_sample();

}  // namespace nhs_number::schema
