#include <provenance/common/critical.hpp>
#include <provenance/registry/record_manager.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

using namespace provenance::schema;

namespace provenance::registry {

record_manager::record_manager(provenance::ledger::object_store& store,
                               event_sink_t sink)
    : store_{store}, sink_{std::move(sink)} {}

std::optional<mint_error_code_t> record_manager::validate(
    const mint_provenance_t& request) {
  if (request.content_package_name.empty()) {
    return mint_error_code::empty_package_name;
  }
  if (request.merkle_root.size() != kHash32Size) {
    return mint_error_code::invalid_merkle_root_length;
  }
  if (request.manifest_hash.size() != kHash32Size) {
    return mint_error_code::invalid_manifest_hash_length;
  }
  return std::nullopt;
}

mint_result_t record_manager::mint(const mint_provenance_t& request,
                                   const time_source_t& clock,
                                   const address_t& sender) {
  if (auto error = validate(request)) {
    return *error;
  }

  auto created_at = clock();
  auto id = store_.allocate();

  auto manifest = package_manifest_t{
      .manifest_version = request.manifest_version,
      .manifest_integrity_algo = request.manifest_integrity_algo,
      .manifest_hash = make_hash32(make_bytes_view(request.manifest_hash)),
      .manifest_storage_blob_ref = request.manifest_storage_blob_ref,
      .parent_manifest_id = request.parent_manifest_id};

  auto record = provenance_record{provenance_record_state_t{
      .id = id,
      .content_package_name = request.content_package_name,
      .merkle_integrity_algo = request.merkle_integrity_algo,
      .merkle_root = make_hash32(make_bytes_view(request.merkle_root)),
      .created_at = created_at,
      .package_storage_blob_ref = request.package_storage_blob_ref,
      .manifest = std::move(manifest)}};

  publish(provenance_minted_event_t{.record_id = record.id(),
                                    .minter = sender,
                                    .package_name = record.content_package_name(),
                                    .merkle_root = record.merkle_root(),
                                    .minted_at = record.created_at()});

  spdlog::debug("Minted provenance record {} for package '{}'",
                to_hex(record.id()), record.content_package_name());
  return mint_result_t{std::move(record)};
}

send_result_t record_manager::mint_and_send_to_sender(
    const mint_provenance_t& request,
    const time_source_t& clock,
    const address_t& sender) {
  auto minted = mint(request, clock, sender);
  if (auto* error = std::get_if<mint_error_code_t>(&minted)) {
    return *error;
  }
  auto& record = std::get<provenance_record>(minted);
  auto id = record.id();
  if (!transfer(std::move(record), sender)) {
    provenance::common::critical("object store refused a freshly minted id",
                                 to_hex(id));
  }
  return id;
}

bool record_manager::transfer(provenance_record record,
                              const address_t& recipient) {
  return store_.transfer(record.state_, recipient);
}

std::optional<provenance_record> record_manager::load(
    const object_id_t& id) const {
  auto stored = store_.load(id);
  if (!stored) {
    return std::nullopt;
  }
  const auto& state = stored->state;
  if (state.id != id || state.content_package_name.empty()) {
    spdlog::error("Stored object {} is not a valid provenance record",
                  to_hex(id));
    return std::nullopt;
  }
  return provenance_record{std::move(stored->state)};
}

void record_manager::destroy(provenance_record record) {
  deconstruct(std::move(record));
}

void record_manager::burn(provenance_record record) {
  deconstruct(std::move(record));
}

void record_manager::deconstruct(provenance_record record) {
  auto id = record.state_.id;
  store_.release(id);
  spdlog::debug("Destroyed provenance record {}", to_hex(id));
}

void record_manager::publish(const provenance_minted_event_t& event) {
  if (!sink_) {
    return;
  }
  try {
    sink_(event);
  } catch (const std::exception& ex) {
    spdlog::warn("Mint event for record {} was not delivered: {}",
                 to_hex(event.record_id), ex.what());
  } catch (...) {
    spdlog::warn("Mint event for record {} was not delivered: unknown error",
                 to_hex(event.record_id));
  }
}

}  // namespace provenance::registry
