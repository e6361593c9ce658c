#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

// Schema type: condition.
// Batch workflow: the ordered preconditions evaluated for every batch. The
// enum value is the position of the condition in a record's conditions_met.
namespace remit::schema {

enum class condition_t : uint8_t {
  business_hours = 0,
  high_value_authorization = 1,
  balance_sufficiency = 2,
  performance_gate = 3
};

inline constexpr std::size_t kConditionCount = 4;

using conditions_met_t = std::array<bool, kConditionCount>;

inline constexpr auto kConditionNames = std::array{
    std::pair<std::string_view, condition_t>{"business_hours",
                                             condition_t::business_hours},
    std::pair<std::string_view, condition_t>{
        "high_value_authorization", condition_t::high_value_authorization},
    std::pair<std::string_view, condition_t>{"balance_sufficiency",
                                             condition_t::balance_sufficiency},
    std::pair<std::string_view, condition_t>{"performance_gate",
                                             condition_t::performance_gate},
};

inline constexpr std::string_view to_string(const condition_t value) {
  return name_of(value, kConditionNames);
}

}  // namespace remit::schema
