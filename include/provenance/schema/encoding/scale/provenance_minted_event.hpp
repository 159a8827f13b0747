#pragma once
#include <provenance/schema/provenance_minted_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const provenance_minted_event<1>& o, ::scale::Encoder& encoder);
void decode(provenance_minted_event<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
