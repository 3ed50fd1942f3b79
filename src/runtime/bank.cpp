#include <spdlog/spdlog.h>
#include <keystone/crypto/pda.hpp>
#include <keystone/runtime/bank.hpp>
#include <keystone/schema/ids.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <string>
#include <utility>

using namespace keystone::schema;

namespace {

keystone::execution::account_info make_account_info(
    const keystone::runtime::account_meta_t& meta,
    const std::optional<account_t>& stored) {
  auto info = keystone::execution::account_info{};
  info.key = meta.key;
  info.is_signer = meta.is_signer;
  info.is_writable = meta.is_writable;
  if (stored) {
    info.owner = stored->owner;
    info.lamports = stored->lamports;
    info.data = stored->data;
    info.executable = stored->executable;
  } else {
    info.owner = kSystemProgramId;
  }
  return info;
}

}  // namespace

namespace keystone::runtime {

void bank::register_program(const pubkey_t& program_id,
                            entrypoint_t entrypoint) {
  spdlog::debug("Registering program {}", to_base58(program_id));
  programs_[program_id] = std::move(entrypoint);
}

void bank::airdrop(const pubkey_t& key, const lamports_t lamports) {
  auto [it, inserted] = accounts_.try_emplace(key);
  if (inserted) {
    it->second.owner = kSystemProgramId;
  }
  it->second.lamports += lamports;
  spdlog::debug("Airdropped {} lamports to {}", lamports, to_base58(key));
}

void bank::install_rent_sysvar(const keystone::sysvar::rent_t& rent) {
  auto data = keystone::sysvar::encode_rent(rent);
  auto account = account_t{};
  account.owner = kSysvarOwnerId;
  account.lamports = rent.minimum_balance(data.size());
  account.data = std::move(data);
  accounts_[kRentSysvarId] = std::move(account);
}

std::optional<account_t> bank::get_account(const pubkey_t& key) const {
  auto it = accounts_.find(key);
  if (it == std::end(accounts_)) {
    return std::nullopt;
  }
  return it->second;
}

void bank::set_account(const pubkey_t& key, account_t account) {
  accounts_[key] = std::move(account);
}

const account_map_t& bank::accounts() const {
  return accounts_;
}

account_map_t bank::checkpoint() const {
  return accounts_;
}

void bank::rollback(account_map_t checkpoint) {
  spdlog::debug("Rolling back to {} accounts", checkpoint.size());
  accounts_ = std::move(checkpoint);
}

program_result bank::process_instruction(const instruction_t& instruction) {
  auto program = programs_.find(instruction.program_id);
  if (program == std::end(programs_)) {
    return make_failure(
        program_error::invalid_instruction_data,
        "program " + to_base58(instruction.program_id) + " is not registered");
  }

  auto seen = std::set<pubkey_t>{};
  auto infos = std::vector<keystone::execution::account_info>{};
  infos.reserve(instruction.accounts.size());
  for (const auto& meta : instruction.accounts) {
    if (!seen.insert(meta.key).second) {
      return make_failure(program_error::invalid_instruction_data,
                          "account " + to_base58(meta.key) +
                              " is listed more than once");
    }
    infos.push_back(make_account_info(meta, get_account(meta.key)));
  }

  auto result = program->second(
      instruction.program_id,
      keystone::execution::account_infos_t{infos.data(), infos.size()},
      bytes_view_t{instruction.data.data(), instruction.data.size()}, *this);
  if (!result.ok()) {
    spdlog::info("Instruction for {} failed ({}); discarding account writes",
                 to_base58(instruction.program_id), to_string(*result.error));
    return result;
  }

  for (const auto& info : infos) {
    if (!info.is_writable) {
      continue;
    }
    accounts_[info.key] = account_t{.lamports = info.lamports,
                                    .owner = info.owner,
                                    .executable = info.executable,
                                    .data = info.data};
  }
  spdlog::info("Instruction for {} succeeded",
               to_base58(instruction.program_id));
  return result;
}

program_result bank::process_transaction(
    std::span<const instruction_t> instructions) {
  auto saved = checkpoint();
  for (const auto& instruction : instructions) {
    auto result = process_instruction(instruction);
    if (!result.ok()) {
      rollback(std::move(saved));
      return result;
    }
  }
  return make_success();
}

program_result bank::invoke_create_account(
    const pubkey_t& caller,
    const keystone::execution::create_account_t& request,
    std::span<const bytes_view_t> signer_seeds) {
  auto& from = request.from;
  auto& to = request.to;

  if (!from.is_signer) {
    return make_failure(program_error::missing_required_signature,
                        "funding account " + to_base58(from.key) +
                            " must sign");
  }
  if (!from.is_writable || !to.is_writable) {
    return make_failure(program_error::invalid_instruction_data,
                        "create_account needs writable accounts");
  }
  if (to.lamports != 0 || !to.data.empty() || to.owner != kSystemProgramId) {
    return make_failure(program_error::account_already_in_use,
                        "account " + to_base58(to.key) + " already in use");
  }
  if (!to.is_signer) {
    auto derived = keystone::crypto::create_program_address(signer_seeds, caller);
    if (!derived || *derived != to.key) {
      return make_failure(program_error::missing_required_signature,
                          "signer seeds do not authorize " + to_base58(to.key));
    }
  }
  if (from.lamports < request.lamports) {
    return make_failure(program_error::insufficient_funds,
                        "need " + std::to_string(request.lamports) +
                            " lamports, payer holds " +
                            std::to_string(from.lamports));
  }

  from.lamports -= request.lamports;
  to.lamports += request.lamports;
  to.data.assign(request.space, 0);
  to.owner = request.owner;
  spdlog::debug("Created account {} ({} bytes, {} lamports) owned by {}",
                to_base58(to.key), request.space, request.lamports,
                to_base58(request.owner));
  return make_success();
}

}  // namespace keystone::runtime
