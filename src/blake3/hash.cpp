#include <mandate/blake3/hash.hpp>
#include <array>

namespace mandate::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const mandate::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update_framed(const mandate::schema::bytes_view_t& bytes) {
  auto size = static_cast<uint32_t>(bytes.size());
  auto prefix = std::array<uint8_t, sizeof(uint32_t)>{};
  for (auto i = std::size_t{0}; i < prefix.size(); ++i) {
    prefix[i] = static_cast<uint8_t>((size >> (i * 8)) & 0xFF);
  }
  update(mandate::schema::bytes_view_t{prefix});
  return update(bytes);
}

mandate::schema::hash32_t hasher::finalize() const {
  auto output = mandate::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace mandate::blake3
