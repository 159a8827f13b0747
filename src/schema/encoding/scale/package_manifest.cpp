#include <provenance/schema/encoding/scale/package_manifest.hpp>

namespace provenance::schema {

void encode(const package_manifest<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.manifest_version, encoder);
  encode(o.manifest_integrity_algo, encoder);
  encode(o.manifest_hash, encoder);
  encode(o.manifest_storage_blob_ref, encoder);
  encode(o.parent_manifest_id, encoder);
}

void decode(package_manifest<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.manifest_version, decoder);
  decode(o.manifest_integrity_algo, decoder);
  decode(o.manifest_hash, decoder);
  decode(o.manifest_storage_blob_ref, decoder);
  decode(o.parent_manifest_id, decoder);
}

}  // namespace provenance::schema
