#pragma once

#include <mandate/schema/delegation_history_entry.hpp>
#include <mandate/schema/encoding/scale/end_reason.hpp>
#include <mandate/schema/encoding/scale/primitives.hpp>
#include <scale/scale.hpp>

namespace mandate::schema {

void encode(const delegation_history_entry<1>& o, ::scale::Encoder& encoder);
void decode(delegation_history_entry<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
