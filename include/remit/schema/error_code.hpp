#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Batch workflow: failure kinds returned by administrative and batch
// operations. Zero is reserved for success.
namespace remit::schema {

enum class error_code : uint32_t {
  unauthorized = 1,
  invalid_time = 2,
  insufficient_balance = 3,
  transfer_failed = 4,
  invalid_threshold = 5,
  invalid_batch = 6,
  performance_gate_closed = 7,
};

inline constexpr auto kErrorCodeNames = std::array{
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{"invalid_time",
                                            error_code::invalid_time},
    std::pair<std::string_view, error_code>{"insufficient_balance",
                                            error_code::insufficient_balance},
    std::pair<std::string_view, error_code>{"transfer_failed",
                                            error_code::transfer_failed},
    std::pair<std::string_view, error_code>{"invalid_threshold",
                                            error_code::invalid_threshold},
    std::pair<std::string_view, error_code>{"invalid_batch",
                                            error_code::invalid_batch},
    std::pair<std::string_view, error_code>{
        "performance_gate_closed", error_code::performance_gate_closed},
};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeNames);
}

inline constexpr std::string_view to_string(const error_code value) {
  return name_of(value, kErrorCodeNames);
}

}  // namespace remit::schema
