#include <keystone/crypto/pda.hpp>
#include <keystone/execution/validator.hpp>
#include <keystone/schema/encoding/fixed/encoder.hpp>
#include <keystone/schema/ids.hpp>
#include <keystone/schema/instruction.hpp>

#include <array>
#include <string>

using namespace keystone::schema;

namespace {

using encoder_t = keystone::schema::encoding::encoder<
    keystone::schema::encoding::fixed_layout_encoder_tag>;

program_result check_arity(keystone::execution::const_account_infos_t accounts,
                           const std::size_t expected) {
  if (accounts.size() != expected) {
    return make_failure(program_error::invalid_instruction_data,
                        "expected " + std::to_string(expected) +
                            " accounts, got " +
                            std::to_string(accounts.size()));
  }
  return make_success();
}

program_result check_payer_and_state(
    const keystone::execution::account_info& payer,
    const keystone::execution::account_info& state) {
  if (!payer.is_signer) {
    return make_failure(program_error::invalid_instruction_data,
                        "payer must sign");
  }
  if (!payer.is_writable) {
    return make_failure(program_error::invalid_instruction_data,
                        "payer must be writable");
  }
  if (!state.is_writable) {
    return make_failure(program_error::invalid_instruction_data,
                        "state account must be writable");
  }
  return make_success();
}

std::optional<std::pair<pubkey_t, uint8_t>> derive_state_address(
    const pubkey_t& program_id,
    const pubkey_t& payer,
    const std::optional<uint8_t> bump) {
  auto seed = make_bytes_view(kStateSeed);
  if (!bump) {
    auto seeds = std::array{seed, make_bytes_view(payer)};
    return keystone::crypto::find_program_address(seeds, program_id);
  }

  auto bump_seed = std::array{*bump};
  auto seeds = std::array{seed, make_bytes_view(payer),
                          bytes_view_t{bump_seed.data(), bump_seed.size()}};
  auto address = keystone::crypto::create_program_address(seeds, program_id);
  if (!address) {
    return std::nullopt;
  }
  return std::pair{*address, *bump};
}

}  // namespace

namespace keystone::execution {

initialize_validation validate_initialize(const pubkey_t& program_id,
                                          const_account_infos_t accounts,
                                          std::optional<uint8_t> bump) {
  auto validation = initialize_validation{};
  validation.result = check_arity(accounts, initialize_accounts::kCount);
  if (!validation.result.ok()) {
    return validation;
  }

  const auto& payer = accounts[initialize_accounts::kPayer];
  const auto& state = accounts[initialize_accounts::kState];
  const auto& rent = accounts[initialize_accounts::kRentSysvar];
  const auto& system_program = accounts[initialize_accounts::kSystemProgram];

  validation.result = check_payer_and_state(payer, state);
  if (!validation.result.ok()) {
    return validation;
  }

  if (rent.key != kRentSysvarId) {
    validation.result = make_failure(program_error::invalid_instruction_data,
                                     "account 2 is not the rent sysvar");
    return validation;
  }
  if (system_program.key != kSystemProgramId) {
    validation.result = make_failure(program_error::invalid_instruction_data,
                                     "account 3 is not the system program");
    return validation;
  }

  auto derived = derive_state_address(program_id, payer.key, bump);
  if (!derived || derived->first != state.key) {
    validation.result = make_failure(
        program_error::pda_mismatch,
        "state account " + to_base58(state.key) +
            " is not the derived address for payer " + to_base58(payer.key));
    return validation;
  }
  validation.bump = derived->second;

  if (state.data.empty()) {
    return validation;
  }
  if (state.owner != program_id) {
    validation.result = make_failure(program_error::invalid_instruction_data,
                                     "state account is held by another owner");
    return validation;
  }
  auto encoder = encoder_t{};
  auto existing = encoder.try_decode<state_record_t>(
      bytes_view_t{state.data.data(), state.data.size()});
  if (!existing || existing->is_initialized) {
    validation.result = make_failure(program_error::invalid_instruction_data,
                                     "state account is already initialized");
    return validation;
  }
  validation.existing = existing;
  return validation;
}

update_validation validate_update(const pubkey_t& program_id,
                                  const_account_infos_t accounts) {
  auto validation = update_validation{};
  validation.result = check_arity(accounts, update_accounts::kCount);
  if (!validation.result.ok()) {
    return validation;
  }

  const auto& payer = accounts[update_accounts::kPayer];
  const auto& state = accounts[update_accounts::kState];

  validation.result = check_payer_and_state(payer, state);
  if (!validation.result.ok()) {
    return validation;
  }

  if (state.owner != program_id) {
    validation.result = make_failure(program_error::invalid_owner,
                                     "state account is not owned by program");
    return validation;
  }
  auto encoder = encoder_t{};
  auto record = encoder.try_decode<state_record_t>(
      bytes_view_t{state.data.data(), state.data.size()});
  if (!record) {
    validation.result = make_failure(program_error::deserialization_failed,
                                     "state account holds a corrupt record");
    return validation;
  }
  if (record->owner != payer.key) {
    validation.result = make_failure(
        program_error::invalid_owner,
        "signer " + to_base58(payer.key) + " does not own the record");
    return validation;
  }
  if (!record->is_initialized) {
    validation.result = make_failure(program_error::invalid_instruction_data,
                                     "state account is not initialized");
    return validation;
  }

  validation.record = *record;
  return validation;
}

}  // namespace keystone::execution
