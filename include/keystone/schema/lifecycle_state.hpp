#pragma once

#include <keystone/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lifecycle state.
// Status tag of the persisted record. Stored as one byte; the zero-filled
// account reads as uninitialized.
namespace keystone::schema {

enum class lifecycle_state_t : uint8_t {
  uninitialized = 0,
  initialized = 1,
  updated = 2
};

inline constexpr auto kLifecycleStateMappings =
    std::array{std::pair<std::string_view, lifecycle_state_t>{
                   "uninitialized", lifecycle_state_t::uninitialized},
               std::pair<std::string_view, lifecycle_state_t>{
                   "initialized", lifecycle_state_t::initialized},
               std::pair<std::string_view, lifecycle_state_t>{
                   "updated", lifecycle_state_t::updated}};

inline constexpr std::optional<lifecycle_state_t> try_make_lifecycle_state(
    const uint8_t raw) {
  return from_underlying(raw, kLifecycleStateMappings);
}

inline constexpr std::string_view to_string(const lifecycle_state_t value) {
  return to_string(value, kLifecycleStateMappings).value_or("unknown");
}

}  // namespace keystone::schema
