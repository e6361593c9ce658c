#pragma once

#include <remit/schema/error_code.hpp>
#include <cstdint>
#include <string>
#include <utility>

namespace remit::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == 0; }
};

using operation_result_t = operation_result<1>;

inline operation_result_t make_error_result(const error_code code,
                                            std::string info,
                                            std::string codespace) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::move(codespace);
  return result;
}

}  // namespace remit::schema
