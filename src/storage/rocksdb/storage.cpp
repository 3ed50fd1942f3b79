#include <keystone/common/critical.hpp>
#include <keystone/storage/rocksdb/storage.hpp>

namespace keystone::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open ledger at {}: {}", path, status.ToString());
    keystone::common::critical("Failed to open ledger");
  }
  spdlog::info("Opened ledger at {}", path);
  store.database.reset(database);

  return store;
}
}  // namespace keystone::storage
