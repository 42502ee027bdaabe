#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nhs_number::schema {

inline constexpr std::size_t kDigitCount{10};
inline constexpr std::size_t kCheckDigitIndex{kDigitCount - 1};

using digit_t = int8_t;
using digits_t = std::array<digit_t, kDigitCount>;
using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

constexpr bool is_digit_value(const digit_t value) {
  return value >= 0 && value <= 9;
}

constexpr bool is_ascii_digit(const char c) {
  return c >= '0' && c <= '9';
}

bytes_view_t make_bytes_view(const bytes_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

}  // namespace nhs_number::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
