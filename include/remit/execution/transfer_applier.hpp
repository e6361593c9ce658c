#pragma once

#include <remit/execution/transfer_service.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_instruction.hpp>
#include <remit/schema/transfer_status.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace remit::execution {

struct apply_result final {
  bool success{true};
  std::size_t applied{};
  // Set only on failure.
  std::optional<std::size_t> failed_index;
  remit::schema::transfer_status status{remit::schema::transfer_status::ok};
};

/// Move every instruction's amount from `source` to its recipient, in order.
///
/// Stops at the first failing transfer; an exception thrown by the service
/// counts as a `backend_failure`. Transfers already applied are left as
/// they are; undoing them is the transfer service's concern.
apply_result apply_transfers(
    transfer_service& service,
    const remit::schema::principal_t& source,
    const std::vector<remit::schema::transfer_instruction_t>& instructions);

}  // namespace remit::execution
