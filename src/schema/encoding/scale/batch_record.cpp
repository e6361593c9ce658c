#include <remit/schema/encoding/scale/batch_record.hpp>

namespace remit::schema {

void encode(const batch_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.timestamp, encoder);
  encode(o.total_amount, encoder);
  encode(o.success, encoder);
  encode(o.conditions_met, encoder);
}

void decode(batch_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.timestamp, decoder);
  decode(o.total_amount, decoder);
  decode(o.success, decoder);
  decode(o.conditions_met, decoder);
}

}  // namespace remit::schema
