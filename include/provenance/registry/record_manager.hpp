#pragma once

#include <provenance/ledger/object_store.hpp>
#include <provenance/registry/event_sink.hpp>
#include <provenance/registry/provenance_record.hpp>
#include <provenance/registry/time_source.hpp>
#include <provenance/schema/mint_error_code.hpp>
#include <provenance/schema/mint_provenance.hpp>
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <variant>

namespace provenance::registry {

using mint_result_t =
    std::variant<provenance_record, provenance::schema::mint_error_code_t>;
using send_result_t = std::variant<provenance::schema::object_id_t,
                                   provenance::schema::mint_error_code_t>;

/// Sole authority for building and tearing down provenance records.
///
/// The manager validates mint requests, takes identities from the object
/// store, stamps creation time from the caller's clock, and publishes one
/// audit event per mint. It keeps no reference to any record it returns.
class record_manager final {
 public:
  /// `sink` may be empty, in which case mint events are dropped.
  explicit record_manager(provenance::ledger::object_store& store,
                          event_sink_t sink = {});

  /// Check request fields in protocol order and report the first violation.
  ///
  /// 1. empty package name
  /// 2. merkle root not 32 bytes
  /// 3. manifest hash not 32 bytes
  static std::optional<provenance::schema::mint_error_code_t> validate(
      const provenance::schema::mint_provenance_t& request);

  /// Validate, allocate an identity, and assemble a new record.
  ///
  /// On failure nothing is allocated and nothing is published. On success
  /// `clock` is read exactly once and the minted event names `sender`.
  mint_result_t mint(const provenance::schema::mint_provenance_t& request,
                     const time_source_t& clock,
                     const provenance::schema::address_t& sender);

  /// Mint, then hand the record to `sender` through the object store.
  send_result_t mint_and_send_to_sender(
      const provenance::schema::mint_provenance_t& request,
      const time_source_t& clock,
      const provenance::schema::address_t& sender);

  /// Persist record under recipient's ownership, consuming the value.
  ///
  /// Returns false when the store no longer accepts the identity, which is
  /// the case once any copy of the record has been destroyed.
  bool transfer(provenance_record record,
                const provenance::schema::address_t& recipient);

  /// Rebuild a record previously transferred into the object store.
  ///
  /// Stored state that could not have come from `mint` (an empty package
  /// name, or an id other than the one it is stored under) is not loaded.
  std::optional<provenance_record> load(
      const provenance::schema::object_id_t& id) const;

  /// Destroy a record held by value by a composing system.
  void destroy(provenance_record record);

  /// Destroy a record its owner took out of the ledger.
  void burn(provenance_record record);

 private:
  /// Release the identity of record; the value is gone on return.
  void deconstruct(provenance_record record);

  void publish(const provenance::schema::provenance_minted_event_t& event);

  provenance::ledger::object_store& store_;
  event_sink_t sink_;
};

}  // namespace provenance::registry
