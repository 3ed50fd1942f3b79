#pragma once
#include <keystone/schema/account.hpp>
#include <keystone/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace keystone::storage {

using account_entry_t =
    std::pair<keystone::schema::pubkey_t, keystone::schema::account_t>;

/// Durable account ledger used by the local runner between invocations.
template <typename Library>
struct storage {
  /// Return the account at key, or std::nullopt when missing.
  std::optional<keystone::schema::account_t> load_account(
      const keystone::schema::pubkey_t& key) const;

  /// Persist the account at key, replacing any previous value.
  void save_account(const keystone::schema::pubkey_t& key,
                    const keystone::schema::account_t& account) const;

  /// Persist several accounts in one atomic write.
  void save_accounts(const std::vector<account_entry_t>& entries) const;

  /// Return every stored account ordered by key.
  std::vector<account_entry_t> list_accounts() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace keystone::storage
