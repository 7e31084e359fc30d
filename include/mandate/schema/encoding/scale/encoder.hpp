#pragma once
#include <mandate/common/critical.hpp>
#include <mandate/schema/encoding/encoder.hpp>
#include <mandate/schema/encoding/scale/delegation_edge.hpp>
#include <mandate/schema/encoding/scale/delegation_event.hpp>
#include <mandate/schema/encoding/scale/delegation_event_type.hpp>
#include <mandate/schema/encoding/scale/delegation_history_entry.hpp>
#include <mandate/schema/encoding/scale/end_reason.hpp>
#include <mandate/schema/encoding/scale/primitives.hpp>
#include <scale/scale.hpp>

namespace mandate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  mandate::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const mandate::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
mandate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    mandate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const mandate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace mandate::schema::encoding
