#include <provenance/schema/encoding/scale/package_manifest.hpp>
#include <provenance/schema/encoding/scale/provenance_record_state.hpp>

namespace provenance::schema {

void encode(const provenance_record_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.content_package_name, encoder);
  encode(o.merkle_integrity_algo, encoder);
  encode(o.merkle_root, encoder);
  encode(o.created_at, encoder);
  encode(o.package_storage_blob_ref, encoder);
  encode(o.manifest, encoder);
}

void decode(provenance_record_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.content_package_name, decoder);
  decode(o.merkle_integrity_algo, decoder);
  decode(o.merkle_root, decoder);
  decode(o.created_at, decoder);
  decode(o.package_storage_blob_ref, decoder);
  decode(o.manifest, decoder);
}

}  // namespace provenance::schema
