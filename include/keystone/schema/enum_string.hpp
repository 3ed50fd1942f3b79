#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace keystone::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Map a raw wire byte onto an enum whose variants are listed in `mappings`.
template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_underlying(
    const std::underlying_type_t<Enum> raw,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (static_cast<std::underlying_type_t<Enum>>(enum_value) == raw) {
      return enum_value;
    }
  }
  return std::nullopt;
}

}  // namespace keystone::schema
