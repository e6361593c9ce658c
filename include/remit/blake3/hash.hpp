#pragma once
#include <remit/schema/primitives.hpp>

namespace remit::blake3 {

remit::schema::hash32_t hash(const remit::schema::bytes_view_t& bytes);

}  // namespace remit::blake3
