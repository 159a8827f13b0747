#pragma once

#include <provenance/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: mint error code.
// Validation outcomes of the mint protocol. Values are checked in declaration
// order and the first violation is reported.
namespace provenance::schema {

enum class mint_error_code : uint32_t {
  empty_package_name = 1,
  invalid_merkle_root_length = 2,
  invalid_manifest_hash_length = 3,
};

using mint_error_code_t = mint_error_code;

inline constexpr auto kMintErrorCodeNames = enum_names<mint_error_code, 3>{{{
    {"EmptyPackageName", mint_error_code::empty_package_name},
    {"InvalidMerkleRootLength", mint_error_code::invalid_merkle_root_length},
    {"InvalidManifestHashLength",
     mint_error_code::invalid_manifest_hash_length},
}}};

constexpr std::string_view to_string(const mint_error_code code) {
  return kMintErrorCodeNames.name_of(code).value_or("Unknown");
}

constexpr std::optional<mint_error_code> mint_error_code_from_string(
    const std::string_view name) {
  return kMintErrorCodeNames.parse(name);
}

}  // namespace provenance::schema
