#include <algorithm>
#include <iterator>
#include <mandate/schema/key/builder.hpp>
#include <ranges>

using namespace mandate::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const signer_id_t& signer_id) {
  std::visit(overloaded{[this](const ed25519_signer_id& arg) {
                          this->write(uint8_t{0});
                          this->write(std::span(arg.public_key.data(),
                                                arg.public_key.size()));
                        },
                        [this](const secp256k1_signer_id& arg) {
                          this->write(uint8_t{1});
                          this->write(std::span(arg.public_key.data(),
                                                arg.public_key.size()));
                        },
                        [this](const named_signer_t& arg) {
                          this->write(uint8_t{2});
                          this->write(std::span(arg.data(), arg.size()));
                        }},
             signer_id);
  return *this;
}
