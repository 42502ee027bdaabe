#include <nhs_number/schema/encoding/scale/nhs_number.hpp>

using namespace nhs_number::schema;

namespace nhs_number::schema::encoding::scale {

void encode(nhs_number_t&& o, ::scale::Encoder& encoder) {
  encode(o.digits, encoder);
}

void decode(nhs_number_t&& o, ::scale::Decoder& decoder) {
  decode(o.digits, decoder);
}

}  // namespace nhs_number::schema::encoding::scale
