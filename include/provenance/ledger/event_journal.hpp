#pragma once

#include <provenance/registry/event_sink.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/provenance_minted_event.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <vector>

namespace provenance::ledger {

/// A journaled audit event and its position in the journal.
struct journal_entry final {
  uint64_t sequence{};
  provenance::schema::provenance_minted_event_t event;
};

/// Append-only RocksDB journal of mint events.
class event_journal final {
 public:
  explicit event_journal(
      provenance::schema::encoding::scale_encoder_t& encoder,
      provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
          storage);

  /// Append event and return its sequence number.
  uint64_t append(const provenance::schema::provenance_minted_event_t& event);

  /// All entries in append order.
  std::vector<journal_entry> list() const;

  /// Sink that appends every published event to this journal.
  provenance::registry::event_sink_t sink();

 private:
  mutable std::mutex mutex_;
  provenance::schema::encoding::scale_encoder_t& encoder_;
  provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
      storage_;
  uint64_t next_sequence_{};
};

}  // namespace provenance::ledger
