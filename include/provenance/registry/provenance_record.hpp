#pragma once

#include <provenance/schema/package_manifest.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/provenance_record_state.hpp>
#include <optional>
#include <string>

namespace provenance::registry {

class record_manager;

/// Immutable provenance record of a content package.
///
/// Only `record_manager` can construct a record (by minting or by loading a
/// persisted one) or tear it down. Everyone else can move it around and read
/// it; there are no mutators. Records are move-only so an identity is held by
/// exactly one value at a time.
class provenance_record final {
 public:
  provenance_record(const provenance_record&) = delete;
  provenance_record& operator=(const provenance_record&) = delete;
  provenance_record(provenance_record&&) noexcept = default;
  provenance_record& operator=(provenance_record&&) = delete;
  ~provenance_record() = default;

  const provenance::schema::object_id_t& id() const;
  const std::string& content_package_name() const;
  uint8_t merkle_integrity_algo() const;
  const provenance::schema::hash32_t& merkle_root() const;
  provenance::schema::timestamp_milliseconds_t created_at() const;
  const provenance::schema::bytes_t& package_storage_blob_ref() const;

  /// Snapshot of the embedded manifest.
  provenance::schema::package_manifest_t manifest() const;
  const std::string& manifest_version() const;
  uint8_t manifest_integrity_algo() const;
  const provenance::schema::hash32_t& manifest_hash() const;
  const provenance::schema::bytes_t& manifest_storage_blob_ref() const;
  const std::optional<provenance::schema::object_id_t>& parent_manifest_id()
      const;

  /// Copy of the persisted layout.
  provenance::schema::provenance_record_state_t state() const;

 private:
  friend class record_manager;

  explicit provenance_record(provenance::schema::provenance_record_state_t state);

  provenance::schema::provenance_record_state_t state_;
};

}  // namespace provenance::registry
