#pragma once

#include <provenance/ledger/object_store.hpp>
#include <provenance/schema/identity_status.hpp>
#include <provenance/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace provenance::testing {

/// Object store backed by a counter and a map. Ids are the big-endian
/// counter in the last eight bytes, starting at 1. Released ids stay
/// tombstoned for the life of the store.
class memory_object_store final : public provenance::ledger::object_store {
 public:
  provenance::schema::object_id_t allocate() override {
    ++allocate_calls_;
    auto id = provenance::schema::object_id_t{};
    auto value = ++counter_;
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      id[id.size() - 1 - i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFFu);
    }
    identities_[id] = provenance::schema::identity_status::live;
    return id;
  }

  void release(const provenance::schema::object_id_t& id) override {
    ++release_calls_;
    auto it = identities_.find(id);
    if (it == std::end(identities_) ||
        it->second == provenance::schema::identity_status::released) {
      return;
    }
    it->second = provenance::schema::identity_status::released;
    released_.push_back(id);
    objects_.erase(id);
  }

  bool transfer(const provenance::schema::provenance_record_state_t& state,
                const provenance::schema::address_t& recipient) override {
    auto it = identities_.find(state.id);
    if (it == std::end(identities_) ||
        it->second != provenance::schema::identity_status::live) {
      return false;
    }
    objects_[state.id] =
        provenance::ledger::owned_object{.owner = recipient, .state = state};
    return true;
  }

  bool contains(const provenance::schema::object_id_t& id) const override {
    return objects_.contains(id);
  }

  std::optional<provenance::ledger::owned_object> load(
      const provenance::schema::object_id_t& id) const override {
    auto it = objects_.find(id);
    if (it == std::end(objects_)) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<provenance::schema::object_id_t> owned_by(
      const provenance::schema::address_t& owner) const override {
    auto ids = std::vector<provenance::schema::object_id_t>{};
    for (const auto& [id, object] : objects_) {
      if (object.owner == owner) {
        ids.push_back(id);
      }
    }
    return ids;
  }

  uint64_t allocate_calls() const { return allocate_calls_; }
  uint64_t release_calls() const { return release_calls_; }
  const std::vector<provenance::schema::object_id_t>& released() const {
    return released_;
  }

 private:
  uint64_t counter_{};
  uint64_t allocate_calls_{};
  uint64_t release_calls_{};
  std::vector<provenance::schema::object_id_t> released_;
  std::map<provenance::schema::object_id_t, provenance::schema::identity_status_t>
      identities_;
  std::map<provenance::schema::object_id_t, provenance::ledger::owned_object>
      objects_;
};

}  // namespace provenance::testing
