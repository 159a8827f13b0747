#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Schema helper: enum names.
// Fixed tables pairing each enumerator with its wire/display name.
namespace provenance::schema {

template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::pair<std::string_view, Enum>, N> entries;

  constexpr std::optional<std::string_view> name_of(const Enum value) const {
    for (const auto& [name, enumerator] : entries) {
      if (enumerator == value) {
        return name;
      }
    }
    return std::nullopt;
  }

  constexpr std::optional<Enum> parse(const std::string_view text) const {
    for (const auto& [name, enumerator] : entries) {
      if (name == text) {
        return enumerator;
      }
    }
    return std::nullopt;
  }
};

}  // namespace provenance::schema
