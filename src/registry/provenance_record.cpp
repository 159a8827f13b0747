#include <provenance/registry/provenance_record.hpp>
#include <utility>

using namespace provenance::schema;

namespace provenance::registry {

provenance_record::provenance_record(provenance_record_state_t state)
    : state_{std::move(state)} {}

const object_id_t& provenance_record::id() const {
  return state_.id;
}

const std::string& provenance_record::content_package_name() const {
  return state_.content_package_name;
}

uint8_t provenance_record::merkle_integrity_algo() const {
  return state_.merkle_integrity_algo;
}

const hash32_t& provenance_record::merkle_root() const {
  return state_.merkle_root;
}

timestamp_milliseconds_t provenance_record::created_at() const {
  return state_.created_at;
}

const bytes_t& provenance_record::package_storage_blob_ref() const {
  return state_.package_storage_blob_ref;
}

package_manifest_t provenance_record::manifest() const {
  return state_.manifest;
}

const std::string& provenance_record::manifest_version() const {
  return state_.manifest.manifest_version;
}

uint8_t provenance_record::manifest_integrity_algo() const {
  return state_.manifest.manifest_integrity_algo;
}

const hash32_t& provenance_record::manifest_hash() const {
  return state_.manifest.manifest_hash;
}

const bytes_t& provenance_record::manifest_storage_blob_ref() const {
  return state_.manifest.manifest_storage_blob_ref;
}

const std::optional<object_id_t>& provenance_record::parent_manifest_id()
    const {
  return state_.manifest.parent_manifest_id;
}

provenance_record_state_t provenance_record::state() const {
  return state_;
}

}  // namespace provenance::registry
