#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mandate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Host supplied, monotonically increasing time counter (ledger sequence).
using ledger_time_t = uint64_t;
using delegation_id_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;

  auto operator<=>(const ed25519_signer_id&) const = default;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;

  auto operator<=>(const secp256k1_signer_id&) const = default;
};

using named_signer_t = hash32_t;  // On chain identity reference
using signer_id_t =
    std::variant<ed25519_signer_id, secp256k1_signer_id, named_signer_t>;

/// Hex rendering of a signer with a scheme tag, used in logs and CLI output.
std::string to_string(const signer_id_t& signer);

/// Parse `ed25519:<hex>`, `secp256k1:<hex>`, or a bare 32-byte hex named
/// signer.
std::optional<signer_id_t> try_parse_signer(const std::string_view text);

}  // namespace mandate::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
