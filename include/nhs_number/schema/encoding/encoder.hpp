#pragma once
#include <nhs_number/schema/primitives.hpp>
#include <optional>

namespace nhs_number::schema::encoding {

// Binary codec selected at build time by tag, e.g.
// encoder<scale_encoder_tag>. Decoding is non-fatal; callers that treat bad
// bytes as a programming error wrap try_decode themselves.
template <typename Library>
struct encoder {
  template <typename T>
  nhs_number::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const nhs_number::schema::bytes_view_t& bytes);
};

}  // namespace nhs_number::schema::encoding
