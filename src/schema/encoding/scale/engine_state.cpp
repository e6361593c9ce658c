#include <remit/schema/encoding/scale/engine_state.hpp>

namespace remit::schema {

void encode(const engine_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.next_batch_id, encoder);
  encode(o.performance_metric, encoder);
}

void decode(engine_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.next_batch_id, decoder);
  decode(o.performance_metric, decoder);
}

}  // namespace remit::schema
