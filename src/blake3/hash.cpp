#include <provenance/blake3/hash.hpp>
#include <array>

namespace provenance::blake3 {

hasher::hasher() {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const provenance::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const uint64_t value) {
  auto le = std::array<uint8_t, sizeof(uint64_t)>{};
  for (std::size_t i = 0; i < le.size(); ++i) {
    le[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFFu);
  }
  blake3_hasher_update(&state_, le.data(), le.size());
  return *this;
}

provenance::schema::hash32_t hasher::finalize() const {
  // BLAKE3_OUT_LEN
  auto output = provenance::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

provenance::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

provenance::schema::hash32_t hash(
    const provenance::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace provenance::blake3
