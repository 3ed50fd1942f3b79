#pragma once

#include <keystone/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: program instructions.
// Byte 0 of the instruction buffer selects the handler.
namespace keystone::schema {

enum class instruction_discriminant_t : uint8_t { initialize = 0, update = 1 };

inline constexpr auto kInstructionDiscriminantMappings =
    std::array{std::pair<std::string_view, instruction_discriminant_t>{
                   "initialize", instruction_discriminant_t::initialize},
               std::pair<std::string_view, instruction_discriminant_t>{
                   "update", instruction_discriminant_t::update}};

inline constexpr std::string_view to_string(
    const instruction_discriminant_t value) {
  return to_string(value, kInstructionDiscriminantMappings).value_or("unknown");
}

/// Create and populate the caller's state account.
///
/// `bump` is the optional trailing byte of the instruction; when absent the
/// canonical bump is derived.
struct initialize_t final {
  std::optional<uint8_t> bump;
};

/// Advance the lifecycle of an initialized state account.
struct update_t final {};

using instruction_payload_t = std::variant<initialize_t, update_t>;

namespace initialize_accounts {
inline constexpr auto kPayer = std::size_t{0};
inline constexpr auto kState = std::size_t{1};
inline constexpr auto kRentSysvar = std::size_t{2};
inline constexpr auto kSystemProgram = std::size_t{3};
inline constexpr auto kCount = std::size_t{4};
}  // namespace initialize_accounts

namespace update_accounts {
inline constexpr auto kPayer = std::size_t{0};
inline constexpr auto kState = std::size_t{1};
inline constexpr auto kCount = std::size_t{2};
}  // namespace update_accounts

}  // namespace keystone::schema
