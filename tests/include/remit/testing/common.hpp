#pragma once

#include <remit/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace remit::testing {

inline remit::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = remit::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline remit::schema::principal_t make_principal(const uint8_t seed) {
  auto principal = remit::schema::principal_t{};
  principal[0] = seed;
  return principal;
}

/// First height of `hour` with the default 144 blocks per hour.
inline remit::schema::block_height_t height_at_hour(const uint64_t hour,
                                                    const uint64_t day = 0) {
  return (day * 24 + hour) * 144;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace remit::testing
