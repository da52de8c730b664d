#pragma once
#include <estate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace estate::schema::encoding {

// Encoder backend is chosen at build time through the tag type; hot swapping
// is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  estate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, estate::schema::bytes_t& out);

  template <typename T>
  T decode(const estate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const estate::schema::bytes_view_t& bytes);
};

}  // namespace estate::schema::encoding
