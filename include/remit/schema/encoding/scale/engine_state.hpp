#pragma once

#include <remit/schema/engine_state.hpp>
#include <scale/scale.hpp>

// Declared beside the schema type so the SCALE codec finds them by
// argument-dependent lookup.
namespace remit::schema {

void encode(const engine_state<1>& o, ::scale::Encoder& encoder);
void decode(engine_state<1>& o, ::scale::Decoder& decoder);

}  // namespace remit::schema
