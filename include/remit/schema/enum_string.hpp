#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Name tables for schema enums. Names are stable: they appear in operation
// results, logs and CLI output.
namespace remit::schema {

template <typename Enum, std::size_t N>
using enum_names_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(const std::string_view value,
                                          const enum_names_t<Enum, N>& names) {
  for (const auto& [name, enum_value] : names) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const enum_names_t<Enum, N>& names,
    const std::string_view fallback = "unknown") {
  for (const auto& [name, enum_value] : names) {
    if (enum_value == value) {
      return name;
    }
  }
  return fallback;
}

/// Parse a stable name. Enums with a name table specialize this.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace remit::schema
