#pragma once

#include <provenance/ledger/object_store.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/identity_status.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>

namespace provenance::ledger {

/// RocksDB-backed object ledger.
///
/// Identities are BLAKE3(`OBJECTID|` || seed || counter). The seed is fixed
/// the first time a database is opened and the counter only moves forward,
/// so a released identity is never produced again. Every allocated id keeps
/// an `IDENTITY|<id>` status entry that turns into a tombstone on release.
class rocksdb_object_store final : public object_store {
 public:
  explicit rocksdb_object_store(
      provenance::schema::encoding::scale_encoder_t& encoder,
      provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
          storage);

  provenance::schema::object_id_t allocate() override;
  void release(const provenance::schema::object_id_t& id) override;
  bool transfer(const provenance::schema::provenance_record_state_t& state,
                const provenance::schema::address_t& recipient) override;
  bool contains(const provenance::schema::object_id_t& id) const override;
  std::optional<owned_object> load(
      const provenance::schema::object_id_t& id) const override;
  std::vector<provenance::schema::object_id_t> owned_by(
      const provenance::schema::address_t& owner) const override;

  /// Number of identities allocated over the lifetime of the database.
  uint64_t allocated_count() const;

 private:
  /// Load the seed, creating and persisting one on first open.
  void load_or_create_seed();

  std::optional<provenance::schema::identity_status_t> identity(
      const provenance::schema::object_id_t& id) const;

  mutable std::mutex mutex_;
  provenance::schema::encoding::scale_encoder_t& encoder_;
  provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
      storage_;
  provenance::schema::hash32_t seed_{};
  uint64_t next_counter_{};
};

}  // namespace provenance::ledger
