#include <spdlog/spdlog.h>
#include <keystone/execution/processor.hpp>
#include <keystone/execution/validator.hpp>
#include <keystone/schema/encoding/fixed/encoder.hpp>
#include <keystone/schema/ids.hpp>
#include <keystone/schema/state_record.hpp>
#include <keystone/sysvar/rent.hpp>

#include <array>
#include <limits>
#include <variant>

using namespace keystone::schema;

namespace {

using encoder_t = keystone::schema::encoding::encoder<
    keystone::schema::encoding::fixed_layout_encoder_tag>;

program_result write_record(const state_record_t& record,
                            keystone::execution::account_info& state) {
  auto encoder = encoder_t{};
  return encoder.encode_into(
      record, mutable_bytes_view_t{state.data.data(), state.data.size()});
}

program_result process_initialize(const pubkey_t& program_id,
                                  keystone::execution::account_infos_t accounts,
                                  const initialize_t& instruction,
                                  keystone::execution::host& host) {
  spdlog::debug("Instruction: Initialize");
  auto validation = keystone::execution::validate_initialize(
      program_id, accounts, instruction.bump);
  if (!validation.result.ok()) {
    return validation.result;
  }

  auto& payer = accounts[initialize_accounts::kPayer];
  auto& state = accounts[initialize_accounts::kState];
  const auto& rent_account = accounts[initialize_accounts::kRentSysvar];

  if (!validation.existing) {
    auto rent = keystone::sysvar::try_decode_rent(
        bytes_view_t{rent_account.data.data(), rent_account.data.size()});
    if (!rent) {
      return make_failure(program_error::deserialization_failed,
                          "rent sysvar data is malformed");
    }

    auto bump_seed = std::array{validation.bump};
    auto signer_seeds =
        std::array{make_bytes_view(kStateSeed), make_bytes_view(payer.key),
                   bytes_view_t{bump_seed.data(), bump_seed.size()}};
    auto created = host.invoke_create_account(
        program_id,
        keystone::execution::create_account_t{
            .from = payer,
            .to = state,
            .lamports = rent->minimum_balance(state_record_layout::kSize),
            .space = state_record_layout::kSize,
            .owner = program_id},
        signer_seeds);
    if (!created.ok()) {
      return created;
    }
  }

  auto record = state_record_t{};
  record.is_initialized = true;
  record.owner = payer.key;
  record.lifecycle_state = lifecycle_state_t::initialized;
  auto written = write_record(record, state);
  if (!written.ok()) {
    return written;
  }
  spdlog::debug("Initialized state {} for owner {} with bump {}",
                to_base58(state.key), to_base58(payer.key), validation.bump);
  return make_success();
}

program_result process_update(const pubkey_t& program_id,
                              keystone::execution::account_infos_t accounts) {
  spdlog::debug("Instruction: Update");
  auto validation = keystone::execution::validate_update(program_id, accounts);
  if (!validation.result.ok()) {
    return validation.result;
  }

  auto record = validation.record;
  if (record.update_count == std::numeric_limits<uint32_t>::max()) {
    return make_failure(program_error::arithmetic_overflow,
                        "update_count is at its maximum");
  }
  record.lifecycle_state = lifecycle_state_t::updated;
  record.update_count += 1;

  auto& state = accounts[update_accounts::kState];
  auto written = write_record(record, state);
  if (!written.ok()) {
    return written;
  }
  spdlog::debug("Updated state {} to count {}", to_base58(state.key),
                record.update_count);
  return make_success();
}

}  // namespace

namespace keystone::execution {

std::optional<instruction_payload_t> decode_instruction(
    const bytes_view_t& instruction_data) {
  if (instruction_data.empty()) {
    return std::nullopt;
  }
  auto arguments = instruction_data.subspan(1);
  switch (instruction_data[0]) {
    case static_cast<uint8_t>(instruction_discriminant_t::initialize): {
      if (arguments.size() > 1) {
        return std::nullopt;
      }
      auto instruction = initialize_t{};
      if (!arguments.empty()) {
        instruction.bump = arguments[0];
      }
      return instruction;
    }
    case static_cast<uint8_t>(instruction_discriminant_t::update):
      if (!arguments.empty()) {
        return std::nullopt;
      }
      return update_t{};
    default:
      return std::nullopt;
  }
}

program_result process_instruction(const pubkey_t& program_id,
                                   account_infos_t accounts,
                                   const bytes_view_t& instruction_data,
                                   host& host) {
  auto instruction = decode_instruction(instruction_data);
  if (!instruction) {
    auto result = make_failure(program_error::invalid_instruction_data,
                               "unrecognized instruction data");
    spdlog::warn("Program failed: {}", result.log);
    return result;
  }

  auto result = std::visit(
      overloaded{[&](const initialize_t& value) {
                   return process_initialize(program_id, accounts, value, host);
                 },
                 [&](const update_t&) {
                   return process_update(program_id, accounts);
                 }},
      *instruction);
  if (!result.ok()) {
    spdlog::warn("Program failed with {}: {}", to_string(*result.error),
                 result.log);
  }
  return result;
}

}  // namespace keystone::execution
