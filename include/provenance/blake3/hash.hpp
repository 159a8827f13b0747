#pragma once
#include <provenance/schema/primitives.hpp>
#include <blake3.h>
#include <cstdint>
#include <span>
#include <string_view>

namespace provenance::blake3 {

/// Incremental BLAKE3 hasher producing 32-byte digests.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const provenance::schema::bytes_view_t& bytes);
  /// Absorb an integer as 8 little-endian bytes.
  hasher& update(uint64_t value);

  provenance::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_{};
};

provenance::schema::hash32_t hash(const std::string_view& str);
provenance::schema::hash32_t hash(const provenance::schema::bytes_view_t& bytes);

}  // namespace provenance::blake3
