#pragma once

#include <keystone/execution/account_info.hpp>
#include <keystone/execution/host.hpp>
#include <keystone/schema/account.hpp>
#include <keystone/schema/primitives.hpp>
#include <keystone/schema/program_result.hpp>
#include <keystone/sysvar/rent.hpp>

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <vector>

namespace keystone::runtime {

/// One entry of an instruction's ordered account list.
struct account_meta_t final {
  keystone::schema::pubkey_t key{};
  bool is_signer{};
  bool is_writable{};
};

struct instruction_t final {
  keystone::schema::pubkey_t program_id{};
  std::vector<account_meta_t> accounts;
  keystone::schema::bytes_t data;
};

using account_map_t =
    std::map<keystone::schema::pubkey_t, keystone::schema::account_t>;

using entrypoint_t = std::function<keystone::schema::program_result(
    const keystone::schema::pubkey_t& program_id,
    keystone::execution::account_infos_t accounts,
    const keystone::schema::bytes_view_t& instruction_data,
    keystone::execution::host& host)>;

/// In-process host: account store, program registry and system program.
///
/// Each instruction runs against copies of the referenced accounts; writable
/// copies are committed back only when the program returns success, so a
/// failed instruction leaves the store untouched. Signatures are not
/// verified: `account_meta_t::is_signer` is taken as already checked.
class bank final : public keystone::execution::host {
 public:
  bank() = default;

  /// Route instructions addressed to `program_id` to `entrypoint`.
  void register_program(const keystone::schema::pubkey_t& program_id,
                        entrypoint_t entrypoint);

  /// Credit lamports to a (possibly new, system-owned) account.
  void airdrop(const keystone::schema::pubkey_t& key,
               keystone::schema::lamports_t lamports);

  /// Store the rent sysvar account the programs read.
  void install_rent_sysvar(const keystone::sysvar::rent_t& rent = {});

  std::optional<keystone::schema::account_t> get_account(
      const keystone::schema::pubkey_t& key) const;

  void set_account(const keystone::schema::pubkey_t& key,
                   keystone::schema::account_t account);

  const account_map_t& accounts() const;

  /// Capture every account, including ones credited outside an instruction.
  account_map_t checkpoint() const;

  /// Restore the accounts captured by `checkpoint`; later accounts vanish.
  void rollback(account_map_t checkpoint);

  /// Execute one instruction with all-or-nothing commit.
  keystone::schema::program_result process_instruction(
      const instruction_t& instruction);

  /// Execute instructions in order; stops at and returns the first failure.
  /// Accounts committed by earlier instructions of the batch are rolled back.
  keystone::schema::program_result process_transaction(
      std::span<const instruction_t> instructions);

  keystone::schema::program_result invoke_create_account(
      const keystone::schema::pubkey_t& caller,
      const keystone::execution::create_account_t& request,
      std::span<const keystone::schema::bytes_view_t> signer_seeds) override;

 private:
  account_map_t accounts_;
  std::map<keystone::schema::pubkey_t, entrypoint_t> programs_;
};

}  // namespace keystone::runtime
