#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: package manifest.
// Embedded value describing the external manifest document of a content
// package. Carries no identity of its own and lives inside its record.
namespace provenance::schema {

template <uint16_t Version>
struct package_manifest;

template <>
struct package_manifest<1> final {
  uint16_t version{1};
  std::string manifest_version;
  uint8_t manifest_integrity_algo{};  // opaque algorithm tag
  hash32_t manifest_hash{};
  bytes_t manifest_storage_blob_ref;
  // Identity of an earlier record; never dereferenced by the registry.
  std::optional<object_id_t> parent_manifest_id;

  bool operator==(const package_manifest<1>&) const = default;
};

using package_manifest_t = package_manifest<1>;

}  // namespace provenance::schema
