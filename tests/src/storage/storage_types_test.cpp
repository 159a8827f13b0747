#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/storage/storage.hpp>
#include <provenance/testing/rocksdb_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string_view>
#include <vector>

using provenance::schema::make_bytes;
using provenance::schema::make_bytes_view;

TEST(storage_types, defaults_are_stable) {
  auto entry = provenance::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());

  auto batch = provenance::storage::write_batch{};
  EXPECT_TRUE(batch.puts.empty());
  EXPECT_TRUE(batch.deletes.empty());
}

TEST(storage_types, put_get_and_delete_round_trip) {
  auto fixture = provenance::testing::rocksdb_fixture{"provenance_storage_kv"};
  auto& storage = fixture.storage();
  auto key = make_bytes(std::string_view{"K|one"});

  EXPECT_FALSE(storage.contains(key));
  EXPECT_FALSE(storage.get<uint64_t>(fixture.encoder(), key).has_value());

  storage.put(fixture.encoder(), key, uint64_t{42});
  EXPECT_TRUE(storage.contains(key));
  auto loaded = storage.get<uint64_t>(fixture.encoder(), key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded.value(), 42u);

  auto batch = provenance::storage::write_batch{};
  batch.deletes.push_back(key);
  storage.write(batch);
  EXPECT_FALSE(storage.contains(key));
  storage.write(batch);
}

TEST(storage_types, write_batch_applies_puts_and_deletes) {
  auto fixture = provenance::testing::rocksdb_fixture{"provenance_storage_batch"};
  auto& storage = fixture.storage();
  auto& encoder = fixture.encoder();
  auto a1 = make_bytes(std::string_view{"A|one"});
  auto a2 = make_bytes(std::string_view{"A|two"});
  auto b1 = make_bytes(std::string_view{"B|one"});
  storage.put(encoder, a1, uint64_t{1});
  storage.put(encoder, b1, uint64_t{9});

  auto batch = provenance::storage::write_batch{};
  batch.deletes.push_back(a1);
  batch.puts.emplace_back(a2, encoder.encode(uint64_t{2}));
  storage.write(batch);

  auto a_prefix = make_bytes(std::string_view{"A|"});
  auto a_rows = storage.list_by_prefix(a_prefix);
  ASSERT_EQ(a_rows.size(), 1u);
  EXPECT_EQ(a_rows[0].first, a2);
  auto a_value = encoder.try_decode<uint64_t>(make_bytes_view(a_rows[0].second));
  ASSERT_TRUE(a_value.has_value());
  EXPECT_EQ(a_value.value(), 2u);

  auto b_rows = storage.list_by_prefix(make_bytes(std::string_view{"B|"}));
  ASSERT_EQ(b_rows.size(), 1u);
  EXPECT_EQ(b_rows[0].first, b1);
}

TEST(storage_types, values_survive_reopen) {
  auto fixture = provenance::testing::rocksdb_fixture{"provenance_storage_reopen"};
  auto key = make_bytes(std::string_view{"K|persist"});
  fixture.storage().put(fixture.encoder(), key, uint64_t{7});

  fixture.reopen();

  auto loaded = fixture.storage().get<uint64_t>(fixture.encoder(), key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded.value(), 7u);
}
