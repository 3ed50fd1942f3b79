#pragma once

#include <keystone/execution/account_info.hpp>
#include <keystone/schema/primitives.hpp>
#include <keystone/schema/program_result.hpp>

#include <cstdint>
#include <span>

namespace keystone::execution {

/// Parameters of the system program's account creation call.
struct create_account_t final {
  account_info& from;
  account_info& to;
  keystone::schema::lamports_t lamports{};
  uint64_t space{};
  keystone::schema::pubkey_t owner{};
};

/// Services the hosting runtime offers a program during one invocation.
class host {
 public:
  virtual ~host() = default;

  /// Fund, allocate and assign `request.to` on behalf of `caller`.
  ///
  /// `signer_seeds` (bump included) must derive `request.to` under `caller`
  /// when `request.to` did not sign the transaction itself.
  virtual keystone::schema::program_result invoke_create_account(
      const keystone::schema::pubkey_t& caller,
      const create_account_t& request,
      std::span<const keystone::schema::bytes_view_t> signer_seeds) = 0;
};

}  // namespace keystone::execution
