#pragma once

#include <keystone/schema/primitives.hpp>

#include <span>

namespace keystone::execution {

/// Account handle passed to the program for one invocation.
///
/// The host fills it from its account store and decides, after the program
/// returns, whether any of the mutations are kept.
struct account_info final {
  keystone::schema::pubkey_t key{};
  keystone::schema::pubkey_t owner{};
  keystone::schema::lamports_t lamports{};
  keystone::schema::bytes_t data;
  bool is_signer{};
  bool is_writable{};
  bool executable{};
};

using account_infos_t = std::span<account_info>;
using const_account_infos_t = std::span<const account_info>;

}  // namespace keystone::execution
