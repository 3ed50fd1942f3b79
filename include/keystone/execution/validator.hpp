#pragma once

#include <keystone/execution/account_info.hpp>
#include <keystone/schema/primitives.hpp>
#include <keystone/schema/program_result.hpp>
#include <keystone/schema/state_record.hpp>

#include <cstdint>
#include <optional>

namespace keystone::execution {

/// Verdict over the Initialize account list.
///
/// On success `bump` is the bump that derives the state account and
/// `existing` holds an already allocated, still uninitialized record (if any).
struct initialize_validation final {
  keystone::schema::program_result result;
  uint8_t bump{};
  std::optional<keystone::schema::state_record_t> existing;
};

/// Verdict over the Update account list; on success `record` is the decoded
/// current state.
struct update_validation final {
  keystone::schema::program_result result;
  keystone::schema::state_record_t record{};
};

/// Check arity, signer, writability, well-known accounts, derived address and
/// the not-yet-initialized precondition, in that order.
initialize_validation validate_initialize(
    const keystone::schema::pubkey_t& program_id,
    const_account_infos_t accounts,
    std::optional<uint8_t> bump);

/// Check arity, signer, writability, ownership and the initialized
/// precondition, in that order.
update_validation validate_update(const keystone::schema::pubkey_t& program_id,
                                  const_account_infos_t accounts);

}  // namespace keystone::execution
