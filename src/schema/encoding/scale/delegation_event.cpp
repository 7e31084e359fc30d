#include <mandate/schema/encoding/scale/delegation_event.hpp>

namespace mandate::schema {

void encode(const delegation_event<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.type, encoder);
  encode(o.delegation_id, encoder);
  encode(o.delegator, encoder);
  encode(o.delegate, encoder);
  encode(o.expiry, encoder);
  encode(o.recorded_at, encoder);
}

void decode(delegation_event<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.type, decoder);
  decode(o.delegation_id, decoder);
  decode(o.delegator, decoder);
  decode(o.delegate, decoder);
  decode(o.expiry, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace mandate::schema
