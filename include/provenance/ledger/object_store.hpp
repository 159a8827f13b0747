#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/provenance_record_state.hpp>
#include <optional>
#include <vector>

namespace provenance::ledger {

/// A persisted record together with its current owner.
struct owned_object final {
  provenance::schema::address_t owner{};
  provenance::schema::provenance_record_state_t state;
};

/// Ownership ledger consumed by the record manager.
///
/// Implementations assign identities, persist records under single-owner
/// semantics, and tombstone identities on release. An identity handed out by
/// `allocate` is never handed out again, and once released it can never be
/// stored again.
class object_store {
 public:
  virtual ~object_store() = default;

  /// Return an identity that has never been returned before.
  virtual provenance::schema::object_id_t allocate() = 0;

  /// Tombstone id and remove anything stored under it. Ids that were never
  /// allocated or are already released are ignored.
  virtual void release(const provenance::schema::object_id_t& id) = 0;

  /// Persist state and make recipient its sole owner, replacing any
  /// previous owner of the same id.
  ///
  /// Returns false, storing nothing, unless state.id was allocated by this
  /// store and has not been released.
  virtual bool transfer(const provenance::schema::provenance_record_state_t& state,
                        const provenance::schema::address_t& recipient) = 0;

  /// True when id currently resolves to a stored object.
  virtual bool contains(const provenance::schema::object_id_t& id) const = 0;

  virtual std::optional<owned_object> load(
      const provenance::schema::object_id_t& id) const = 0;

  /// Identities of every object currently owned by owner.
  virtual std::vector<provenance::schema::object_id_t> owned_by(
      const provenance::schema::address_t& owner) const = 0;
};

}  // namespace provenance::ledger
