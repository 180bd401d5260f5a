#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <span>

namespace registrar::schema::encoding {

// Encoding backend is a build time choice, selected by tag.
template <typename Library>
struct encoder {
  template <typename T>
  registrar::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, registrar::schema::bytes_t& out);

  template <typename T>
  T decode(const registrar::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const registrar::schema::bytes_view_t& bytes);
};

}  // namespace registrar::schema::encoding
