#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: object keys.
// Canonical key prefixes and key codecs for the object ledger, identity
// tombstones, ownership index and audit event journal.
namespace provenance::schema::key {

inline constexpr std::string_view kObjectSeedKey{"SYS|OBJECT|SEED"};
inline constexpr std::string_view kObjectCounterKey{"SYS|OBJECT|NEXT"};
inline constexpr std::string_view kEventCounterKey{"SYS|EVENT|NEXT"};
inline constexpr std::string_view kObjectKeyPrefix{"OBJECT|"};
inline constexpr std::string_view kIdentityKeyPrefix{"IDENTITY|"};
inline constexpr std::string_view kOwnerKeyPrefix{"OWNER|"};
inline constexpr std::string_view kEventKeyPrefix{"EVENT|"};

template <typename Encoder, typename T>
provenance::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
provenance::schema::bytes_t make_prefix_key(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
provenance::schema::bytes_t make_object_key(
    Encoder& encoder,
    const provenance::schema::object_id_t& id) {
  return make_prefixed_key(encoder, kObjectKeyPrefix, id);
}

/// Key holding the identity_status of an allocated id.
template <typename Encoder>
provenance::schema::bytes_t make_identity_key(
    Encoder& encoder,
    const provenance::schema::object_id_t& id) {
  return make_prefixed_key(encoder, kIdentityKeyPrefix, id);
}

/// Prefix shared by every ownership marker of one owner.
template <typename Encoder>
provenance::schema::bytes_t make_owner_prefix(
    Encoder& encoder,
    const provenance::schema::address_t& owner) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, owner);
}

template <typename Encoder>
provenance::schema::bytes_t make_owner_key(
    Encoder& encoder,
    const provenance::schema::address_t& owner,
    const provenance::schema::object_id_t& id) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix, std::tuple{owner, id});
}

/// Event keys order lexicographically by sequence (big-endian suffix).
template <typename Encoder>
provenance::schema::bytes_t make_event_key(Encoder& encoder,
                                           const uint64_t sequence) {
  auto key = make_prefix_key(encoder, kEventKeyPrefix);
  for (auto shift = 56; shift >= 0; shift -= 8) {
    key.push_back(static_cast<uint8_t>((sequence >> shift) & 0xFFu));
  }
  return key;
}

}  // namespace provenance::schema::key
