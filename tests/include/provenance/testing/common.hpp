#pragma once

#include <provenance/schema/mint_provenance.hpp>
#include <provenance/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace provenance::testing {

inline provenance::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = provenance::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline provenance::schema::bytes_t make_hash_bytes(const uint8_t seed,
                                                   const std::size_t size = 32) {
  auto out = provenance::schema::bytes_t(size);
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline provenance::schema::address_t make_address(const uint8_t seed) {
  auto address = provenance::schema::address_t{};
  address[0] = seed;
  return address;
}

/// The "Test Package" request used across suites.
inline provenance::schema::mint_provenance_t make_test_package_request() {
  return provenance::schema::mint_provenance_t{
      .content_package_name = "Test Package",
      .merkle_integrity_algo = 61,
      .merkle_root = make_hash_bytes(1),
      .package_storage_blob_ref =
          provenance::schema::make_bytes(std::string_view{"package_blob_id"}),
      .manifest_version = "1.4",
      .manifest_integrity_algo = 61,
      .manifest_hash = make_hash_bytes(101),
      .manifest_storage_blob_ref =
          provenance::schema::make_bytes(std::string_view{"manifest_blob_id"}),
      .parent_manifest_id = std::nullopt};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace provenance::testing
