#include <remit/schema/encoding/scale/transfer_instruction.hpp>

namespace remit::schema {

void encode(const transfer_instruction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
  encode(o.requires_high_value_check, encoder);
}

void decode(transfer_instruction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
  decode(o.requires_high_value_check, decoder);
}

}  // namespace remit::schema
