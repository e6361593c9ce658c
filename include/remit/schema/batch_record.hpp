#pragma once
#include <remit/schema/condition.hpp>
#include <remit/schema/primitives.hpp>

// Schema type: batch record.
// Batch workflow: immutable audit entry written once per batch that reached
// transfer execution.
namespace remit::schema {

template <uint16_t Version>
struct batch_record;

template <>
struct batch_record<1> final {
  uint16_t version{1};
  uint64_t id{};
  block_height_t timestamp{};
  uint64_t total_amount{};
  bool success{};
  conditions_met_t conditions_met{};
};

using batch_record_t = batch_record<1>;

}  // namespace remit::schema
