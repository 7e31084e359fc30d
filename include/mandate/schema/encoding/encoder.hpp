#pragma once
#include <mandate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace mandate::schema::encoding {

// Callers name the codec library through a tag type and the specialization
// supplies it. Every persisted value goes through here; keys do not.
template <typename Library>
struct encoder {
  template <typename T>
  mandate::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const mandate::schema::bytes_view_t& bytes);
};

}  // namespace mandate::schema::encoding
