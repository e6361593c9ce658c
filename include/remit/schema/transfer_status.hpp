#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Schema type: transfer status.
// Batch workflow: outcome of one value movement reported by the transfer
// service. Sufficiency failures are reported apart from other faults.
namespace remit::schema {

enum class transfer_status : uint32_t {
  ok = 0,
  insufficient_funds = 1,
  same_principal = 2,
  non_positive_amount = 3,
  backend_failure = 4
};

inline constexpr auto kTransferStatusNames = std::array{
    std::pair<std::string_view, transfer_status>{"ok", transfer_status::ok},
    std::pair<std::string_view, transfer_status>{
        "insufficient_funds", transfer_status::insufficient_funds},
    std::pair<std::string_view, transfer_status>{
        "same_principal", transfer_status::same_principal},
    std::pair<std::string_view, transfer_status>{
        "non_positive_amount", transfer_status::non_positive_amount},
    std::pair<std::string_view, transfer_status>{
        "backend_failure", transfer_status::backend_failure},
};

inline constexpr std::string_view to_string(const transfer_status value) {
  return name_of(value, kTransferStatusNames);
}

}  // namespace remit::schema
