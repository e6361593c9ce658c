#pragma once
#include <remit/schema/primitives.hpp>

// Schema type: transfer instruction.
// Batch workflow: one value movement from the batch caller to a recipient.
namespace remit::schema {

template <uint16_t Version>
struct transfer_instruction;

template <>
struct transfer_instruction<1> final {
  uint16_t version{1};
  principal_t recipient{};
  uint64_t amount{};
  // Carried for audit parity; gating uses the batch total instead.
  bool requires_high_value_check{};
};

using transfer_instruction_t = transfer_instruction<1>;

}  // namespace remit::schema
