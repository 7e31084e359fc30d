#pragma once
#include <mandate/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in the schema namespace so the codec finds them by argument
// dependent lookup when it walks a signer_id_t variant.
namespace mandate::schema {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
