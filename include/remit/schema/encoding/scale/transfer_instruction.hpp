#pragma once

#include <remit/schema/transfer_instruction.hpp>
#include <scale/scale.hpp>

// Declared beside the schema type so the SCALE codec finds them by
// argument-dependent lookup.
namespace remit::schema {

void encode(const transfer_instruction<1>& o, ::scale::Encoder& encoder);
void decode(transfer_instruction<1>& o, ::scale::Decoder& decoder);

}  // namespace remit::schema
