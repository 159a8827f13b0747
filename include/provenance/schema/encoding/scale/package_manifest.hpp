#pragma once
#include <provenance/schema/package_manifest.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in the schema namespace so the SCALE codec finds them by ADL.
namespace provenance::schema {

void encode(const package_manifest<1>& o, ::scale::Encoder& encoder);
void decode(package_manifest<1>& o, ::scale::Decoder& decoder);

}  // namespace provenance::schema
