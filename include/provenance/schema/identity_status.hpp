#pragma once

#include <provenance/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: identity status.
// Lifecycle of an identity handed out by an object store. An identity only
// moves from live to released, never back.
namespace provenance::schema {

enum class identity_status : uint8_t {
  live = 1,
  released = 2,
};

using identity_status_t = identity_status;

inline constexpr auto kIdentityStatusNames = enum_names<identity_status, 2>{{{
    {"live", identity_status::live},
    {"released", identity_status::released},
}}};

constexpr std::string_view to_string(const identity_status status) {
  return kIdentityStatusNames.name_of(status).value_or("unknown");
}

}  // namespace provenance::schema
