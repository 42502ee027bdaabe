#pragma once
#include <nhs_number/common/critical.hpp>
#include <nhs_number/schema/encoding/encoder.hpp>
#include <nhs_number/schema/encoding/scale/nhs_number.hpp>
#include <scale/scale.hpp>
#include <utility>

namespace nhs_number::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  nhs_number::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const nhs_number::schema::bytes_view_t& bytes);
};

template <typename T>
nhs_number::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    nhs_number::common::critical("SCALE encoding failed");
  }
  return std::move(encoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const nhs_number::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace nhs_number::schema::encoding
