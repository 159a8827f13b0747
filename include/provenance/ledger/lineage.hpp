#pragma once

#include <provenance/ledger/object_store.hpp>
#include <provenance/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace provenance::ledger {

/// Why a lineage walk stopped.
enum class lineage_end : uint8_t {
  root = 0,            // last record has no parent
  missing_parent = 1,  // parent id does not resolve in the store
  cycle = 2,           // parent id was already visited
  depth_limit = 3,     // max_depth records visited
  missing_start = 4,   // starting id does not resolve
};

struct lineage final {
  /// Visited records, starting record first.
  std::vector<provenance::schema::object_id_t> chain;
  lineage_end end{lineage_end::root};
  /// Parent id that stopped the walk for missing_parent and cycle.
  std::optional<provenance::schema::object_id_t> dangling;
};

/// Follow parent manifest links from start through store.
///
/// Records never validate their parents, so a chain may end in an id that
/// was released or never existed, or loop back on itself.
lineage walk_lineage(const object_store& store,
                     const provenance::schema::object_id_t& start,
                     std::size_t max_depth = 256);

}  // namespace provenance::ledger
