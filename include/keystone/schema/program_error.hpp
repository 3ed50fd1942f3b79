#pragma once

#include <keystone/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace keystone::schema {

/// Error codes surfaced to the host. Values are part of the interface
/// description and must not be renumbered.
enum class program_error : uint32_t {
  write_overflow = 0,
  invalid_instruction_data = 1,
  pda_mismatch = 2,
  invalid_owner = 3,
  deserialization_failed = 4,
  arithmetic_overflow = 5,
  insufficient_funds = 6,
  account_already_in_use = 7,
  missing_required_signature = 8,
};

inline constexpr auto kProgramErrorMappings = std::array{
    std::pair<std::string_view, program_error>{"write_overflow",
                                               program_error::write_overflow},
    std::pair<std::string_view, program_error>{
        "invalid_instruction_data", program_error::invalid_instruction_data},
    std::pair<std::string_view, program_error>{"pda_mismatch",
                                               program_error::pda_mismatch},
    std::pair<std::string_view, program_error>{"invalid_owner",
                                               program_error::invalid_owner},
    std::pair<std::string_view, program_error>{
        "deserialization_failed", program_error::deserialization_failed},
    std::pair<std::string_view, program_error>{
        "arithmetic_overflow", program_error::arithmetic_overflow},
    std::pair<std::string_view, program_error>{
        "insufficient_funds", program_error::insufficient_funds},
    std::pair<std::string_view, program_error>{
        "account_already_in_use", program_error::account_already_in_use},
    std::pair<std::string_view, program_error>{
        "missing_required_signature",
        program_error::missing_required_signature}};

inline constexpr std::string_view to_string(const program_error value) {
  return to_string(value, kProgramErrorMappings).value_or("unknown");
}

}  // namespace keystone::schema
