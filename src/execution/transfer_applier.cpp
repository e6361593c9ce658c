#include <remit/execution/transfer_applier.hpp>

#include <spdlog/spdlog.h>

#include <exception>

using namespace remit::schema;

namespace remit::execution {

apply_result apply_transfers(
    transfer_service& service,
    const principal_t& source,
    const std::vector<transfer_instruction_t>& instructions) {
  auto result = apply_result{};
  for (std::size_t i = 0; i < instructions.size(); ++i) {
    const auto& instruction = instructions[i];
    auto status = transfer_status::backend_failure;
    try {
      status =
          service.transfer(instruction.amount, source, instruction.recipient);
    } catch (const std::exception& ex) {
      spdlog::error("Transfer service threw on instruction {}: {}", i,
                    ex.what());
    }
    if (status != transfer_status::ok) {
      spdlog::error("Transfer {} of {} failed with {} after {} applied", i,
                    instruction.amount, to_string(status), result.applied);
      result.success = false;
      result.failed_index = i;
      result.status = status;
      return result;
    }
    ++result.applied;
  }
  return result;
}

}  // namespace remit::execution
