#include <gtest/gtest.h>
#include <provenance/ledger/lineage.hpp>
#include <provenance/testing/common.hpp>
#include <provenance/testing/memory_object_store.hpp>

#include <optional>

using provenance::ledger::lineage_end;
using provenance::ledger::walk_lineage;
using provenance::schema::object_id_t;
using provenance::testing::make_address;
using provenance::testing::make_hash;
using provenance::testing::memory_object_store;

namespace {

void put_record(memory_object_store& store,
                const object_id_t& id,
                const std::optional<object_id_t>& parent) {
  auto state = provenance::schema::provenance_record_state_t{};
  state.id = id;
  state.content_package_name = "pkg";
  state.manifest.parent_manifest_id = parent;
  ASSERT_TRUE(store.transfer(state, make_address(1)));
}

}  // namespace

TEST(lineage, walks_to_root) {
  auto store = memory_object_store{};
  auto root = store.allocate();
  auto middle = store.allocate();
  auto leaf = store.allocate();
  put_record(store, root, std::nullopt);
  put_record(store, middle, root);
  put_record(store, leaf, middle);

  auto walk = walk_lineage(store, leaf);

  EXPECT_EQ(walk.end, lineage_end::root);
  ASSERT_EQ(walk.chain.size(), 3u);
  EXPECT_EQ(walk.chain[0], leaf);
  EXPECT_EQ(walk.chain[1], middle);
  EXPECT_EQ(walk.chain[2], root);
  EXPECT_FALSE(walk.dangling.has_value());
}

TEST(lineage, stops_at_missing_parent) {
  auto store = memory_object_store{};
  auto child = store.allocate();
  put_record(store, child, make_hash(1));

  auto walk = walk_lineage(store, child);

  EXPECT_EQ(walk.end, lineage_end::missing_parent);
  ASSERT_EQ(walk.chain.size(), 1u);
  EXPECT_EQ(walk.dangling, make_hash(1));
}

TEST(lineage, released_parent_is_missing) {
  auto store = memory_object_store{};
  auto parent = store.allocate();
  auto child = store.allocate();
  put_record(store, parent, std::nullopt);
  put_record(store, child, parent);
  store.release(parent);

  auto walk = walk_lineage(store, child);

  EXPECT_EQ(walk.end, lineage_end::missing_parent);
  EXPECT_EQ(walk.dangling, parent);
}

TEST(lineage, detects_cycles) {
  auto store = memory_object_store{};
  auto a = store.allocate();
  auto b = store.allocate();
  put_record(store, a, b);
  put_record(store, b, a);

  auto walk = walk_lineage(store, a);

  EXPECT_EQ(walk.end, lineage_end::cycle);
  EXPECT_EQ(walk.chain.size(), 2u);
  EXPECT_EQ(walk.dangling, a);
}

TEST(lineage, honours_depth_limit) {
  auto store = memory_object_store{};
  auto root = store.allocate();
  auto middle = store.allocate();
  auto leaf = store.allocate();
  put_record(store, root, std::nullopt);
  put_record(store, middle, root);
  put_record(store, leaf, middle);

  auto walk = walk_lineage(store, leaf, 2);

  EXPECT_EQ(walk.end, lineage_end::depth_limit);
  EXPECT_EQ(walk.chain.size(), 2u);
}

TEST(lineage, reports_missing_start) {
  auto store = memory_object_store{};
  auto walk = walk_lineage(store, make_hash(9));
  EXPECT_EQ(walk.end, lineage_end::missing_start);
  EXPECT_TRUE(walk.chain.empty());
}
