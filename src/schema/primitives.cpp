#include <nhs_number/schema/primitives.hpp>

#include <charconv>

namespace nhs_number::schema {

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHex[byte >> 4u]);
    out.push_back(kHex[byte & 0x0Fu]);
  }
  return out;
}

// Bare pairs of hex digits, either case. No prefix, no separators.
std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto byte = uint8_t{};
    const auto* first = hex.data() + i;
    const auto* last = first + 2;
    auto [end, ec] = std::from_chars(first, last, byte, 16);
    if (ec != std::errc{} || end != last) {
      return std::nullopt;
    }
    decoded.push_back(byte);
  }
  return decoded;
}

}  // namespace nhs_number::schema
