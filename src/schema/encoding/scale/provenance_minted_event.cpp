#include <provenance/schema/encoding/scale/provenance_minted_event.hpp>

namespace provenance::schema {

void encode(const provenance_minted_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.record_id, encoder);
  encode(o.minter, encoder);
  encode(o.package_name, encoder);
  encode(o.merkle_root, encoder);
  encode(o.minted_at, encoder);
}

void decode(provenance_minted_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.record_id, decoder);
  decode(o.minter, decoder);
  decode(o.package_name, decoder);
  decode(o.merkle_root, decoder);
  decode(o.minted_at, decoder);
}

}  // namespace provenance::schema
