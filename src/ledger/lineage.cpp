#include <provenance/ledger/lineage.hpp>
#include <set>
#include <utility>

using namespace provenance::schema;

namespace provenance::ledger {

lineage walk_lineage(const object_store& store,
                     const object_id_t& start,
                     const std::size_t max_depth) {
  auto result = lineage{};
  auto visited = std::set<object_id_t>{};

  auto current = store.load(start);
  if (!current) {
    result.end = lineage_end::missing_start;
    result.dangling = start;
    return result;
  }

  while (true) {
    result.chain.push_back(current->state.id);
    visited.insert(current->state.id);

    const auto& parent = current->state.manifest.parent_manifest_id;
    if (!parent) {
      result.end = lineage_end::root;
      return result;
    }
    if (visited.contains(*parent)) {
      result.end = lineage_end::cycle;
      result.dangling = parent;
      return result;
    }
    if (result.chain.size() >= max_depth) {
      result.end = lineage_end::depth_limit;
      return result;
    }
    auto next = store.load(*parent);
    if (!next) {
      result.end = lineage_end::missing_parent;
      result.dangling = parent;
      return result;
    }
    current = std::move(next);
  }
}

}  // namespace provenance::ledger
