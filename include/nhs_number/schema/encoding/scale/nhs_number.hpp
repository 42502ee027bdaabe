#pragma once
#include <nhs_number/schema/nhs_number.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace nhs_number::schema::encoding::scale {

// Wire layout: the ten digits as a fixed-size array, one byte each, no
// length prefix.
void encode(nhs_number::schema::nhs_number_t&& o, ::scale::Encoder& encoder);
void decode(nhs_number::schema::nhs_number_t&& o, ::scale::Decoder& decoder);

}  // namespace nhs_number::schema::encoding::scale
