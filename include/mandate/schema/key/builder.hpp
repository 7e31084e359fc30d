#pragma once
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace mandate::schema::key {

/// Raw byte key writer. Keys are plain concatenations so that every keyspace
/// stays scannable by its string prefix.
struct builder final {
  mandate::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const signer_id_t& signer_id);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// Write an integer most significant byte first, so keys sort numerically.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace mandate::schema::key
