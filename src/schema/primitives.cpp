#include <mandate/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace mandate::schema {

namespace {

constexpr auto kEd25519Tag = std::string_view{"ed25519:"};
constexpr auto kSecp256k1Tag = std::string_view{"secp256k1:"};

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_array<32>(bytes);
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

std::string to_string(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& value) {
                   return std::string{kEd25519Tag} +
                          to_hex(bytes_view_t{value.public_key});
                 },
                 [](const secp256k1_signer_id& value) {
                   return std::string{kSecp256k1Tag} +
                          to_hex(bytes_view_t{value.public_key});
                 },
                 [](const named_signer_t& value) {
                   return to_hex(bytes_view_t{value});
                 }},
      signer);
}

std::optional<signer_id_t> try_parse_signer(const std::string_view text) {
  if (text.starts_with(kEd25519Tag)) {
    auto key = try_make_array<32>(text.substr(kEd25519Tag.size()));
    if (!key) {
      return std::nullopt;
    }
    return signer_id_t{ed25519_signer_id{.public_key = *key}};
  }
  if (text.starts_with(kSecp256k1Tag)) {
    auto key = try_make_array<33>(text.substr(kSecp256k1Tag.size()));
    if (!key) {
      return std::nullopt;
    }
    return signer_id_t{secp256k1_signer_id{.public_key = *key}};
  }
  auto named = try_make_hash32(text);
  if (!named) {
    return std::nullopt;
  }
  return signer_id_t{*named};
}

}  // namespace mandate::schema
