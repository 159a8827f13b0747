#pragma once
#include <provenance/schema/provenance_record_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace provenance::schema {

void encode(const provenance_record_state<1>& o, ::scale::Encoder& encoder);
void decode(provenance_record_state<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
