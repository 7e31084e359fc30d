#include <mandate/schema/encoding/scale/delegation_history_entry.hpp>

namespace mandate::schema {

void encode(const delegation_history_entry<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.delegation_id, encoder);
  encode(o.delegator, encoder);
  encode(o.delegate, encoder);
  encode(o.created_at, encoder);
  encode(o.ended_at, encoder);
  encode(o.ended_reason, encoder);
}

void decode(delegation_history_entry<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.delegation_id, decoder);
  decode(o.delegator, decoder);
  decode(o.delegate, decoder);
  decode(o.created_at, decoder);
  decode(o.ended_at, decoder);
  decode(o.ended_reason, decoder);
}

}  // namespace mandate::schema
