#pragma once
#include <nhs_number/common/critical.hpp>
#include <nhs_number/schema/nhs_number.hpp>

#include <optional>

namespace nhs_number::schema::encoding {

/// Decode exactly one NHS number and enforce the digit range. Codecs lay the
/// digits out one byte each, so anything but ten bytes is rejected up front.
template <typename Encoder>
std::optional<nhs_number_t> try_decode_nhs_number(Encoder& encoder,
                                                  const bytes_view_t& bytes) {
  if (bytes.size() != kDigitCount) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<nhs_number_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_nhs_number(decoded->digits);
}

template <typename Encoder>
nhs_number_t decode_nhs_number(Encoder& encoder, const bytes_view_t& bytes) {
  auto decoded = try_decode_nhs_number(encoder, bytes);
  if (!decoded) {
    nhs_number::common::critical("decode_nhs_number received {} invalid bytes",
                                 bytes.size());
  }
  return *decoded;
}

}  // namespace nhs_number::schema::encoding
