#pragma once
#include <remit/schema/primitives.hpp>

// Schema type: engine state.
// Batch workflow: counters and owner-settable values persisted alongside the
// audit ledger.
namespace remit::schema {

template <uint16_t Version>
struct engine_state;

template <>
struct engine_state<1> final {
  uint16_t version{1};
  uint64_t next_batch_id{1};
  uint64_t performance_metric{};
};

using engine_state_t = engine_state<1>;

}  // namespace remit::schema
