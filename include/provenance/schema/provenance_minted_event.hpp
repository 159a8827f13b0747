#pragma once

#include <provenance/schema/primitives.hpp>
#include <string>

// Schema type: provenance minted event.
// Audit fact published once per successful mint.
namespace provenance::schema {

template <uint16_t Version>
struct provenance_minted_event;

template <>
struct provenance_minted_event<1> final {
  uint16_t version{1};
  object_id_t record_id{};
  address_t minter{};
  std::string package_name;
  hash32_t merkle_root{};
  timestamp_milliseconds_t minted_at{};

  bool operator==(const provenance_minted_event<1>&) const = default;
};

using provenance_minted_event_t = provenance_minted_event<1>;

}  // namespace provenance::schema
