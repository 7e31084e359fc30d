#pragma once
#include <blake3.h>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>

namespace mandate::blake3 {

/// Incremental BLAKE3 digest.
class hasher final {
 public:
  hasher();

  hasher& update(const mandate::schema::bytes_view_t& bytes);
  /// Feed `bytes` preceded by its length as a little endian uint32, so that
  /// adjacent fields cannot run into each other.
  hasher& update_framed(const mandate::schema::bytes_view_t& bytes);

  mandate::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

}  // namespace mandate::blake3
