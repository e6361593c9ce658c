#pragma once

#include <remit/schema/batch_record.hpp>
#include <scale/scale.hpp>

// Declared beside the schema type so the SCALE codec finds them by
// argument-dependent lookup.
namespace remit::schema {

void encode(const batch_record<1>& o, ::scale::Encoder& encoder);
void decode(batch_record<1>& o, ::scale::Decoder& decoder);

}  // namespace remit::schema
