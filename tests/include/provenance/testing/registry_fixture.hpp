#pragma once

#include <provenance/registry/record_manager.hpp>
#include <provenance/schema/provenance_minted_event.hpp>
#include <provenance/testing/common.hpp>
#include <provenance/testing/memory_object_store.hpp>

#include <cstdint>
#include <vector>

namespace provenance::testing {

/// Record manager wired to an in-memory store, a recording sink, and a
/// counting clock.
class registry_fixture final {
 public:
  registry_fixture()
      : manager_{store_, [this](const auto& event) { events_.push_back(event); }} {}

  registry_fixture(const registry_fixture&) = delete;
  registry_fixture& operator=(const registry_fixture&) = delete;
  registry_fixture(registry_fixture&&) = delete;
  registry_fixture& operator=(registry_fixture&&) = delete;

  memory_object_store& store() { return store_; }
  provenance::registry::record_manager& manager() { return manager_; }
  const std::vector<provenance::schema::provenance_minted_event_t>& events()
      const {
    return events_;
  }

  /// Clock reporting timestamp and counting how often it was read.
  provenance::registry::time_source_t clock(
      const provenance::schema::timestamp_milliseconds_t timestamp) {
    return [this, timestamp] {
      ++clock_reads_;
      return timestamp;
    };
  }
  uint64_t clock_reads() const { return clock_reads_; }

 private:
  memory_object_store store_;
  std::vector<provenance::schema::provenance_minted_event_t> events_;
  uint64_t clock_reads_{};
  provenance::registry::record_manager manager_;
};

}  // namespace provenance::testing
