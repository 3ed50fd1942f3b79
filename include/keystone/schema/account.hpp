#pragma once
#include <keystone/schema/primitives.hpp>

namespace keystone::schema {

/// Host-side account contents, as held by the bank and the ledger.
struct account_t final {
  lamports_t lamports{};
  pubkey_t owner{};
  bool executable{};
  bytes_t data;

  bool operator==(const account_t&) const = default;
};

}  // namespace keystone::schema
