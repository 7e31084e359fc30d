#pragma once

#include <mandate/schema/delegation_edge.hpp>
#include <mandate/schema/encoding/scale/primitives.hpp>
#include <scale/scale.hpp>

namespace mandate::schema {

void encode(const delegation_edge<1>& o, ::scale::Encoder& encoder);
void decode(delegation_edge<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
