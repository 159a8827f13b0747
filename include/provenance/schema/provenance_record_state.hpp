#pragma once
#include <provenance/schema/package_manifest.hpp>
#include <provenance/schema/primitives.hpp>
#include <string>

// Schema type: provenance record state.
// Persisted layout of a provenance record, field for field. Only the record
// manager turns one of these into a live record.
namespace provenance::schema {

template <uint16_t Version>
struct provenance_record_state;

template <>
struct provenance_record_state<1> final {
  uint16_t version{1};
  object_id_t id{};
  std::string content_package_name;
  uint8_t merkle_integrity_algo{};
  hash32_t merkle_root{};
  timestamp_milliseconds_t created_at{};
  bytes_t package_storage_blob_ref;
  package_manifest_t manifest;

  bool operator==(const provenance_record_state<1>&) const = default;
};

using provenance_record_state_t = provenance_record_state<1>;

}  // namespace provenance::schema
