#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/encoding/scale/delegation_event_type.hpp>
#include <mandate/schema/encoding/scale/primitives.hpp>
#include <scale/scale.hpp>

namespace mandate::schema {

void encode(const delegation_event<1>& o, ::scale::Encoder& encoder);
void decode(delegation_event<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
