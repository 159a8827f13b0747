#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: mint provenance.
// Raw, unvalidated inputs to the mint protocol. Hash fields are plain byte
// sequences here; their lengths are checked when minting.
namespace provenance::schema {

template <uint16_t Version>
struct mint_provenance;

template <>
struct mint_provenance<1> final {
  uint16_t version{1};
  std::string content_package_name;
  uint8_t merkle_integrity_algo{};
  bytes_t merkle_root;
  bytes_t package_storage_blob_ref;
  std::string manifest_version;
  uint8_t manifest_integrity_algo{};
  bytes_t manifest_hash;
  bytes_t manifest_storage_blob_ref;
  std::optional<object_id_t> parent_manifest_id;
};

using mint_provenance_t = mint_provenance<1>;

}  // namespace provenance::schema
