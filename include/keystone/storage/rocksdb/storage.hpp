#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <keystone/common/critical.hpp>
#include <keystone/schema/encoding/scale/encoder.hpp>
#include <keystone/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace keystone::storage {

namespace detail {

using encoder_t = keystone::schema::encoding::encoder<
    keystone::schema::encoding::scale_encoder_tag>;

/// (lamports, owner, executable, data)
using account_record_t = std::tuple<uint64_t,
                                    keystone::schema::pubkey_t,
                                    bool,
                                    keystone::schema::bytes_t>;

inline constexpr auto kAccountPrefix = std::string_view{"ACCT|"};

inline std::string make_account_key(const keystone::schema::pubkey_t& key) {
  auto out = std::string{kAccountPrefix};
  out.append(reinterpret_cast<const char*>(key.data()), key.size());
  return out;
}

inline std::optional<keystone::schema::pubkey_t> parse_account_key(
    std::string_view key) {
  if (!key.starts_with(kAccountPrefix)) {
    return std::nullopt;
  }
  key.remove_prefix(kAccountPrefix.size());
  return keystone::schema::try_make_pubkey(keystone::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(key.data()), key.size()});
}

inline std::string encode_account(const keystone::schema::account_t& account) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(account_record_t{
      account.lamports, account.owner, account.executable, account.data});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

inline std::optional<keystone::schema::account_t> decode_account(
    const ROCKSDB_NAMESPACE::Slice& value) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<account_record_t>(
      keystone::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded) {
    return std::nullopt;
  }
  auto account = keystone::schema::account_t{};
  std::tie(account.lamports, account.owner, account.executable, account.data) =
      std::move(*decoded);
  return account;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<keystone::schema::account_t> load_account(
      const keystone::schema::pubkey_t& key) const;
  void save_account(const keystone::schema::pubkey_t& key,
                    const keystone::schema::account_t& account) const;
  void save_accounts(const std::vector<account_entry_t>& entries) const;
  std::vector<account_entry_t> list_accounts() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<keystone::schema::account_t>
storage<rocksdb_storage_tag>::load_account(
    const keystone::schema::pubkey_t& key) const {
  if (!database) {
    keystone::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::make_account_key(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get account from RocksDB: {}", status.ToString());
    keystone::common::critical("Failed to get account from RocksDB");
  }
  auto account = detail::decode_account(ROCKSDB_NAMESPACE::Slice{value});
  if (!account) {
    keystone::common::critical("failed to decode stored account");
  }
  return account;
}

inline void storage<rocksdb_storage_tag>::save_account(
    const keystone::schema::pubkey_t& key,
    const keystone::schema::account_t& account) const {
  save_accounts({account_entry_t{key, account}});
}

inline void storage<rocksdb_storage_tag>::save_accounts(
    const std::vector<account_entry_t>& entries) const {
  if (!database) {
    keystone::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, account] : entries) {
    auto put_status = batch.Put(detail::make_account_key(key),
                                detail::encode_account(account));
    if (!put_status.ok()) {
      keystone::common::critical("failed staging account write");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to write accounts to RocksDB: {}",
                  write_status.ToString());
    keystone::common::critical("failed to persist accounts");
  }
}

inline std::vector<account_entry_t>
storage<rocksdb_storage_tag>::list_accounts() const {
  if (!database) {
    keystone::common::critical("RocksDB database is not initialized");
  }
  auto entries = std::vector<account_entry_t>{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kAccountPrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kAccountPrefix)) {
      break;
    }

    auto key = detail::parse_account_key(key_view);
    auto account = detail::decode_account(iterator->value());
    if (!key || !account) {
      spdlog::warn("Skipping undecodable ledger entry of {} bytes",
                   key_view.size());
      iterator->Next();
      continue;
    }
    entries.emplace_back(*key, std::move(*account));
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Ledger iteration failed: {}",
                  iterator->status().ToString());
    keystone::common::critical("failed to list accounts");
  }
  return entries;
}

}  // namespace keystone::storage
