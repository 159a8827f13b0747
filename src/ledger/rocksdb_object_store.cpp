#include <provenance/blake3/hash.hpp>
#include <provenance/ledger/rocksdb_object_store.hpp>
#include <provenance/schema/key/object_keys.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <random>
#include <string_view>
#include <tuple>
#include <utility>

using namespace provenance::schema;

namespace {

using stored_object_t = std::tuple<address_t, provenance_record_state_t>;

hash32_t make_seed() {
  auto device = std::random_device{};
  auto hasher = provenance::blake3::hasher{};
  hasher.update(std::string_view{"OBJECTSEED|"});
  hasher.update(static_cast<uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count()));
  for (auto i = 0; i < 4; ++i) {
    hasher.update((static_cast<uint64_t>(device()) << 32u) | device());
  }
  return hasher.finalize();
}

object_id_t trailing_id(const bytes_t& key) {
  if (key.size() < kHash32Size) {
    provenance::common::critical("ownership key shorter than an object id");
  }
  return make_hash32(bytes_view_t{key.data() + (key.size() - kHash32Size),
                                  kHash32Size});
}

}  // namespace

namespace provenance::ledger {

rocksdb_object_store::rocksdb_object_store(
    provenance::schema::encoding::scale_encoder_t& encoder,
    provenance::storage::storage<provenance::storage::rocksdb_storage_tag>&
        storage)
    : encoder_{encoder}, storage_{storage} {
  auto lock = std::scoped_lock{mutex_};
  load_or_create_seed();
  auto counter_key = key::make_prefix_key(encoder_, key::kObjectCounterKey);
  next_counter_ = storage_.get<uint64_t>(encoder_, counter_key).value_or(0);
  spdlog::info("Object ledger ready with {} identities allocated",
               next_counter_);
}

void rocksdb_object_store::load_or_create_seed() {
  auto seed_key = key::make_prefix_key(encoder_, key::kObjectSeedKey);
  auto seed = storage_.get<hash32_t>(encoder_, seed_key);
  if (seed) {
    seed_ = *seed;
    return;
  }
  seed_ = make_seed();
  storage_.put(encoder_, seed_key, seed_);
  spdlog::info("Created object ledger seed {}", to_hex(seed_));
}

object_id_t rocksdb_object_store::allocate() {
  auto lock = std::scoped_lock{mutex_};
  auto counter = next_counter_;
  auto id = provenance::blake3::hasher{}
                .update(std::string_view{"OBJECTID|"})
                .update(make_bytes_view(seed_))
                .update(counter)
                .finalize();
  // Persist the counter before handing out the id so a crash cannot
  // replay it.
  auto batch = provenance::storage::write_batch{};
  batch.puts.emplace_back(
      key::make_prefix_key(encoder_, key::kObjectCounterKey),
      encoder_.encode(counter + 1));
  batch.puts.emplace_back(key::make_identity_key(encoder_, id),
                          encoder_.encode(identity_status::live));
  storage_.write(batch);
  next_counter_ = counter + 1;
  spdlog::debug("Allocated object id {} (counter {})", to_hex(id), counter);
  return id;
}

std::optional<identity_status_t> rocksdb_object_store::identity(
    const object_id_t& id) const {
  return storage_.get<identity_status_t>(encoder_,
                                         key::make_identity_key(encoder_, id));
}

void rocksdb_object_store::release(const object_id_t& id) {
  auto lock = std::scoped_lock{mutex_};
  if (identity(id) != identity_status::live) {
    spdlog::debug("Release of unknown or released object id {} ignored",
                  to_hex(id));
    return;
  }
  auto object_key = key::make_object_key(encoder_, id);
  auto batch = provenance::storage::write_batch{};
  batch.puts.emplace_back(key::make_identity_key(encoder_, id),
                          encoder_.encode(identity_status::released));
  if (auto existing = storage_.get<stored_object_t>(encoder_, object_key)) {
    batch.deletes.push_back(object_key);
    batch.deletes.push_back(
        key::make_owner_key(encoder_, std::get<0>(*existing), id));
  }
  storage_.write(batch);
  spdlog::debug("Released object id {}", to_hex(id));
}

bool rocksdb_object_store::transfer(const provenance_record_state_t& state,
                                    const address_t& recipient) {
  auto lock = std::scoped_lock{mutex_};
  auto status = identity(state.id);
  if (status != identity_status::live) {
    spdlog::warn("Refusing to store object {}: identity is {}",
                 to_hex(state.id),
                 status ? to_string(*status) : std::string_view{"unallocated"});
    return false;
  }
  auto object_key = key::make_object_key(encoder_, state.id);
  auto batch = provenance::storage::write_batch{};

  auto previous = storage_.get<stored_object_t>(encoder_, object_key);
  if (previous && std::get<0>(*previous) != recipient) {
    batch.deletes.push_back(
        key::make_owner_key(encoder_, std::get<0>(*previous), state.id));
  }
  batch.puts.emplace_back(object_key,
                          encoder_.encode(stored_object_t{recipient, state}));
  batch.puts.emplace_back(key::make_owner_key(encoder_, recipient, state.id),
                          bytes_t{});
  storage_.write(batch);
  spdlog::debug("Object {} now owned by {}", to_hex(state.id),
                to_hex(recipient));
  return true;
}

bool rocksdb_object_store::contains(const object_id_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.contains(key::make_object_key(encoder_, id));
}

std::optional<owned_object> rocksdb_object_store::load(
    const object_id_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  auto stored =
      storage_.get<stored_object_t>(encoder_, key::make_object_key(encoder_, id));
  if (!stored) {
    return std::nullopt;
  }
  return owned_object{.owner = std::get<0>(*stored),
                      .state = std::move(std::get<1>(*stored))};
}

std::vector<object_id_t> rocksdb_object_store::owned_by(
    const address_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_owner_prefix(encoder_, owner);
  auto ids = std::vector<object_id_t>{};
  for (const auto& entry : storage_.list_by_prefix(prefix)) {
    ids.push_back(trailing_id(entry.first));
  }
  return ids;
}

uint64_t rocksdb_object_store::allocated_count() const {
  auto lock = std::scoped_lock{mutex_};
  return next_counter_;
}

}  // namespace provenance::ledger
