#pragma once

#include <keystone/execution/account_info.hpp>
#include <keystone/execution/host.hpp>
#include <keystone/schema/instruction.hpp>
#include <keystone/schema/primitives.hpp>
#include <keystone/schema/program_result.hpp>

#include <optional>

namespace keystone::execution {

/// Parse the instruction buffer: discriminant byte plus, for Initialize, an
/// optional bump byte. Returns std::nullopt for anything else.
std::optional<keystone::schema::instruction_payload_t> decode_instruction(
    const keystone::schema::bytes_view_t& instruction_data);

/// Program entry point.
///
/// Dispatches on the discriminant, validates the account list, and writes the
/// state account. Either every write of the invocation lands or the returned
/// result carries an error and the host must discard the accounts.
keystone::schema::program_result process_instruction(
    const keystone::schema::pubkey_t& program_id,
    account_infos_t accounts,
    const keystone::schema::bytes_view_t& instruction_data,
    host& host);

}  // namespace keystone::execution
