#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <span>

namespace provenance::schema::encoding {

// Encoders are selected at build time through a library tag, e.g.
//   auto enc = encoder<scale_encoder_tag>{};
// Hot swapping encoders at runtime is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  provenance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, provenance::schema::bytes_t& out);

  template <typename T>
  T decode(const provenance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const provenance::schema::bytes_view_t& bytes);
};

}  // namespace provenance::schema::encoding
